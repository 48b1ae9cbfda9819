#include "cli/CommandFactory.hpp"

#include <algorithm>

namespace clicore {

void CommandFactory::registerCreator(const std::string& type, Creator creator) {
    creators[type] = std::move(creator);
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& type) const {
    auto it = creators.find(type);
    if (it == creators.end()) return nullptr;
    return it->second();
}

bool CommandFactory::contains(const std::string& type) const {
    return creators.find(type) != creators.end();
}

std::vector<std::string> CommandFactory::types() const {
    std::vector<std::string> out;
    out.reserve(creators.size());
    for (const auto& kv : creators) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

}
