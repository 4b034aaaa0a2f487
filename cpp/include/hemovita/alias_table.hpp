#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hemovita {

// Many-to-one map from lab markers and network nodes to the supplement key
// that is actually scheduled. Names without an entry map to themselves.
class AliasTable {
public:
    AliasTable() = default;

    void add_alias(std::string alias, std::string key);

    [[nodiscard]] std::string canonical(std::string_view name) const;

    [[nodiscard]] bool contains(const std::string& alias) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] std::vector<std::string> aliases_of(const std::string& key) const;

    [[nodiscard]] static AliasTable defaults();

private:
    std::unordered_map<std::string, std::string> keys_;
    std::vector<std::string> order_;
};

}  // namespace hemovita
