#pragma once

#include <functional>
#include <memory>
#include <string>
#include <typeinfo>
#include <unordered_map>
#include <vector>

#include "cli/ICommand.hpp"

namespace clicore {

/**
 * @brief Maps command type handles to creators of ICommand instances
 *
 * The handle stored in CommandDefinition::commandType is opaque to the
 * core; hosts may register any string. registerType<T>() uses
 * commandTypeOf<T>() so definitions built by CliBuilder resolve here.
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    void registerCreator(const std::string& type, Creator creator);

    template <typename TCommand>
    void registerType(const std::string& type) {
        registerCreator(type, [] { return std::make_unique<TCommand>(); });
    }

    /// nullptr when no creator is registered for type.
    std::unique_ptr<ICommand> create(const std::string& type) const;
    bool contains(const std::string& type) const;
    std::vector<std::string> types() const;

private:
    std::unordered_map<std::string, Creator> creators;
};

/// Default type handle for a command class.
template <typename TCommand>
std::string commandTypeOf() {
    return typeid(TCommand).name();
}

}
