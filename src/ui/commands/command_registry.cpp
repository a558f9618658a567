#include "command_registry.hpp"

#include <trigon/logger.hpp>

namespace trigon
{

void CommandRegistry::register_command(Command cmd)
{
    if (commands_.count(cmd.id))
        TRIGON_LOG_DEBUG("commands", "Replacing '{}'", cmd.id);
    else
        TRIGON_LOG_TRACE("commands", "register {}", cmd.id);
    std::string id = cmd.id;
    commands_[id]  = std::move(cmd);
}

void CommandRegistry::register_command(const std::string&    id,
                                       const std::string&    label,
                                       std::function<void()> callback,
                                       const std::string&    shortcut,
                                       const std::string&    category)
{
    register_command(Command{id, label, category, shortcut, std::move(callback)});
}

bool CommandRegistry::execute(const std::string& id)
{
    Command* cmd = lookup(id);
    if (!cmd || !cmd->enabled || !cmd->callback)
    {
        TRIGON_LOG_DEBUG("commands", "Cannot execute '{}'", id);
        return false;
    }
    // Copy first: the callback may re-register its own id
    auto cb = cmd->callback;
    cb();
    return true;
}

const Command* CommandRegistry::find(const std::string& id) const
{
    auto it = commands_.find(id);
    return it != commands_.end() ? &it->second : nullptr;
}

void CommandRegistry::set_enabled(const std::string& id, bool enabled)
{
    if (Command* cmd = lookup(id))
        cmd->enabled = enabled;
}

void CommandRegistry::set_shortcut_text(const std::string& id, const std::string& shortcut)
{
    if (Command* cmd = lookup(id))
        cmd->shortcut = shortcut;
}

Command* CommandRegistry::lookup(const std::string& id)
{
    auto it = commands_.find(id);
    return it != commands_.end() ? &it->second : nullptr;
}

}   // namespace trigon
