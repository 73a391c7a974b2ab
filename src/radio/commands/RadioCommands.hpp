#pragma once

#include "../../core/router/CommandRegistry.hpp"
#include "../RadioClient.hpp"

#include <functional>

namespace sbr::radio {

    // Registers "bands" and "pota". The client must outlive the registry built from the builder.
    bool registerRadioCommands(core::CommandRegistry::Builder& builder, RadioClient& client, std::function<qint64()> nowFn);

    core::CommandSpec bandsCommand(RadioClient& client);
    core::CommandSpec potaCommand(RadioClient& client, std::function<qint64()> nowFn);

} // namespace sbr::radio
