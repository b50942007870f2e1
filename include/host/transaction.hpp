#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace haproxyotel {

// Sample fetch names used by the tracing hooks
namespace fetch {
inline constexpr std::string_view kMethod           = "method";
inline constexpr std::string_view kPathQuery        = "pathq";
inline constexpr std::string_view kSource           = "src";
inline constexpr std::string_view kFrontendName     = "fe_name";
inline constexpr std::string_view kBackendName      = "be_name";
inline constexpr std::string_view kServerName       = "srv_name";
inline constexpr std::string_view kTxnStatus        = "txn_status";
inline constexpr std::string_view kTerminationState = "txn_sess_term_state";
} // namespace fetch

/**
 * @brief Abstract view of one proxied transaction
 *
 * Implemented by the host binding. Every callback invocation for a request
 * gets its own ITransaction object, but all of them address the same
 * transaction-scoped variables, which is how sibling callbacks find the
 * request's trace.
 *
 * Accessors throw HostError when the host itself fails; a fetch that
 * simply has no value returns nullopt.
 */
class ITransaction {
public:
    virtual ~ITransaction() = default;

    using HeaderVisitor = std::function<void(std::string_view name, std::string_view value)>;

    [[nodiscard]] virtual std::optional<std::string> fetch_string(std::string_view name) = 0;
    [[nodiscard]] virtual std::optional<int64_t> fetch_integer(std::string_view name) = 0;

    [[nodiscard]] virtual std::optional<std::string> get_var_string(std::string_view name) const = 0;
    [[nodiscard]] virtual std::optional<bool> get_var_bool(std::string_view name) const = 0;
    virtual void set_var(std::string_view name, std::string_view value) = 0;
    virtual void set_var(std::string_view name, bool value) = 0;

    /// Visit every request header (names as the host stores them, usually lowercase)
    virtual void for_each_request_header(const HeaderVisitor& visitor) const = 0;
};

struct StatusLine {
    int64_t code = 0;
    std::string reason;
};

/**
 * @brief HTTP message flowing through a filter (request or response)
 */
class IHttpMessage {
public:
    virtual ~IHttpMessage() = default;

    [[nodiscard]] virtual bool is_response() const = 0;
    virtual void set_header(std::string_view name, std::string_view value) = 0;

    /// Status line of a response message
    [[nodiscard]] virtual StatusLine status_line() const = 0;
};

/// Fetch a field the hook cannot proceed without
[[nodiscard]] std::string require_string(ITransaction& txn, std::string_view name);

} // namespace haproxyotel
