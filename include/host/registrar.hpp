#pragma once

#include "host/transaction.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace haproxyotel {

enum class FilterResult : uint8_t {
    CONTINUE,
    WAIT,
    ERROR
};

/// Hook points an action may be attached to
enum class ActionPhase : uint8_t {
    HTTP_REQ,
    HTTP_RES,
    HTTP_AFTER_RES
};

/**
 * @brief Per-stream HTTP filter instance
 *
 * The host creates one instance per stream that has the filter declared,
 * so state kept here lives for one proxying attempt only.
 */
class IFilter {
public:
    virtual ~IFilter() = default;

    virtual FilterResult http_headers(ITransaction& txn, IHttpMessage& msg) = 0;
    virtual FilterResult end_analyze(ITransaction& txn, bool response_channel) = 0;
};

/**
 * @brief Registration surface exposed by the host during module load
 */
class IRegistrar {
public:
    virtual ~IRegistrar() = default;

    using ActionFn = std::function<void(ITransaction& txn, const std::vector<std::string>& args)>;
    using FilterFactory = std::function<std::unique_ptr<IFilter>(std::string_view args)>;

    virtual void register_action(std::string name, std::vector<ActionPhase> phases,
                                 size_t nargs, ActionFn action) = 0;
    virtual void register_filter(std::string name, FilterFactory factory) = 0;
};

} // namespace haproxyotel
