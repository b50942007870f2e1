#include "host/transaction.hpp"
#include "core/error.hpp"

#include <format>

namespace haproxyotel {

std::string require_string(ITransaction& txn, std::string_view name) {
    auto value = txn.fetch_string(name);
    if (!value) {
        throw HostError(std::format("sample fetch '{}' returned no value", name));
    }
    return std::move(*value);
}

} // namespace haproxyotel
