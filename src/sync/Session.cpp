// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <sync/Session.hpp>

#include <format>

namespace readalong
{

Session::Session(SynthesisPipeline pipeline, SyncConfig syncConfig, HighlightCallback callback):
    _pipeline { std::move(pipeline) }, _engine { syncConfig, std::move(callback) }
{
}

auto Session::generate(std::string_view source, const VoiceSettings& voice, const ProgressCallback& progress)
    -> Result<std::shared_ptr<const GenerationResult>>
{
    auto const ticket = _tracker.begin();
    _engine.detach(ticket.id);

    auto result = _pipeline.run(source, voice, ticket, progress);
    if (!_tracker.isCurrent(ticket.id))
    {
        log::debug("Dropping result of superseded generation {}", ticket.id);
        return makeError(ErrorCode::StaleGeneration, std::format("generation {} was superseded", ticket.id));
    }
    if (!result)
        return std::unexpected(result.error());

    auto generation = std::make_shared<const GenerationResult>(std::move(*result));
    if (auto adopted = adopt(generation); !adopted)
        return std::unexpected(adopted.error());
    return generation;
}

auto Session::adopt(std::shared_ptr<const GenerationResult> generation) -> VoidResult
{
    if (!generation)
        return makeError(ErrorCode::InvalidArgument, "cannot adopt an empty generation");

    auto lock = std::lock_guard(_mutex);
    auto const id = generation->generation;
    if (!_tracker.isCurrent(id) || (_current && _current->generation >= id))
    {
        log::debug("Dropping result of superseded generation {}", id);
        return makeError(ErrorCode::StaleGeneration, std::format("generation {} was superseded", id));
    }

    if (auto attached = _engine.attach(generation->index, id); !attached)
        return attached;
    _current = std::move(generation);
    return {};
}

auto Session::current() const -> std::shared_ptr<const GenerationResult>
{
    auto lock = std::lock_guard(_mutex);
    return _current;
}

} // namespace readalong
