#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace termlink::core::catalog {

/*
===============================================================================
 Capability descriptor tables
===============================================================================

The gateway API surface varies between deployments: services may be missing,
method names differ and request fields come in snake/camel variants. Instead
of probing objects at runtime, every name the engine may use is declared here
as ordered alias lists. Resolution is a table lookup against the protobuf
descriptors compiled into the build (see Catalog).

Alias lists are ordered: the first alias a service or message exposes wins.
===============================================================================
*/

using Aliases = std::span<const std::string_view>;

// ---------------------------------------------------------------------
// Capability keys
// ---------------------------------------------------------------------
inline constexpr std::string_view CONNECTION      = "connection";
inline constexpr std::string_view ACCOUNT         = "account";
inline constexpr std::string_view ACCOUNT_HELPER  = "account-helper";
inline constexpr std::string_view MARKET_INFO     = "market-info";
inline constexpr std::string_view SYMBOLS         = "symbols";
inline constexpr std::string_view CHARTS          = "charts";
inline constexpr std::string_view MARKET_BOOK     = "market-book";
inline constexpr std::string_view TRADE_FUNCTIONS = "trade-functions";
inline constexpr std::string_view SESSION         = "session";
inline constexpr std::string_view TERMINAL        = "terminal";

// ---------------------------------------------------------------------
// Capability -> service-name aliases
// ---------------------------------------------------------------------
namespace service {
inline constexpr std::string_view CONNECTION[]      = {"mt5_term_api.Connection", "mt5_term_api.ConnectionService"};
inline constexpr std::string_view ACCOUNT[]         = {"mt5_term_api.Account", "mt5_term_api.AccountService"};
inline constexpr std::string_view ACCOUNT_HELPER[]  = {"mt5_term_api.AccountHelper", "mt5_term_api.AccountHelperService"};
inline constexpr std::string_view MARKET_INFO[]     = {"mt5_term_api.MarketInfo", "mt5_term_api.MarketInfoService"};
inline constexpr std::string_view SYMBOLS[]         = {"mt5_term_api.Symbols", "mt5_term_api.SymbolsService"};
inline constexpr std::string_view CHARTS[]          = {"mt5_term_api.Charts", "mt5_term_api.ChartsService"};
inline constexpr std::string_view MARKET_BOOK[]     = {"mt5_term_api.MarketBook", "mt5_term_api.DomService"};
inline constexpr std::string_view TRADE_FUNCTIONS[] = {"mt5_term_api.TradeFunctions", "mt5_term_api.TradingHelper"};
inline constexpr std::string_view SESSION[]         = {"mt5_term_api.Session", "mt5_term_api.SessionService"};
inline constexpr std::string_view TERMINAL[]        = {"mt5_term_api.Terminal", "mt5_term_api.TerminalService"};
} // namespace service

struct Capability {
    std::string_view key;
    Aliases services;
};

inline constexpr std::array<Capability, 10> CAPABILITIES = {{
    {CONNECTION,      service::CONNECTION},
    {ACCOUNT,         service::ACCOUNT},
    {ACCOUNT_HELPER,  service::ACCOUNT_HELPER},
    {MARKET_INFO,     service::MARKET_INFO},
    {SYMBOLS,         service::SYMBOLS},
    {CHARTS,          service::CHARTS},
    {MARKET_BOOK,     service::MARKET_BOOK},
    {TRADE_FUNCTIONS, service::TRADE_FUNCTIONS},
    {SESSION,         service::SESSION},
    {TERMINAL,        service::TERMINAL},
}};

// Capabilities the stub registry attaches on every connect
inline constexpr std::array<std::string_view, 7> REGISTRY_CAPABILITIES = {
    ACCOUNT, ACCOUNT_HELPER, MARKET_INFO, SYMBOLS, CHARTS, MARKET_BOOK, TRADE_FUNCTIONS
};

// Capabilities whose presence makes a FULL deployment
inline constexpr std::array<std::string_view, 2> HANDSHAKE_CAPABILITIES = {SESSION, TERMINAL};

// Any of these attached lets a LITE deployment be soft-accepted
inline constexpr std::array<std::string_view, 4> LITE_EVIDENCE_CAPABILITIES = {
    ACCOUNT_HELPER, MARKET_INFO, SYMBOLS, ACCOUNT
};

[[nodiscard]]
inline constexpr const Capability* find_capability(std::string_view key) noexcept {
    for (const auto& c : CAPABILITIES) {
        if (c.key == key) {
            return &c;
        }
    }
    return nullptr;
}

// ---------------------------------------------------------------------
// API modules (proto files), in login-discovery scan order
// ---------------------------------------------------------------------
inline constexpr std::array<std::string_view, 11> MODULES = {
    "mt5_term_api/connection.proto",
    "mt5_term_api/account.proto",
    "mt5_term_api/account_helper.proto",
    "mt5_term_api/market_info.proto",
    "mt5_term_api/symbols.proto",
    "mt5_term_api/charts.proto",
    "mt5_term_api/market_book.proto",
    "mt5_term_api/trade_functions.proto",
    "mt5_term_api/auth.proto",
    "mt5_term_api/session.proto",
    "mt5_term_api/terminal.proto",
};


// ---------------------------------------------------------------------
// Request field aliases
// ---------------------------------------------------------------------
namespace field {
inline constexpr std::string_view LOGIN[]         = {"login", "user", "account", "login_id"};
inline constexpr std::string_view PASSWORD[]      = {"password", "pwd", "pass"};
inline constexpr std::string_view SERVER[]        = {"server", "server_name", "mt_cluster_name"};
inline constexpr std::string_view IDENTITY[]      = {"terminal_instance_guid", "terminalInstanceGuid", "id", "guid"};
inline constexpr std::string_view HOST[]          = {"host"};
inline constexpr std::string_view PORT[]          = {"port"};
inline constexpr std::string_view BASE_SYMBOL[]   = {"base_chart_symbol", "base_symbol"};
inline constexpr std::string_view READY_TIMEOUT[] = {"terminal_readiness_waiting_timeout_seconds", "timeout_seconds"};
inline constexpr std::string_view SYMBOL[]        = {"symbol", "symbol_name", "name"};
inline constexpr std::string_view SELECTED_ONLY[] = {"selected_only", "mode"};

// Reply paths carrying a server-assigned identity
inline constexpr std::string_view REPLY_IDENTITY[] = {
    "data.terminal_instance_guid", "data.terminalInstanceGuid", "terminal_instance_guid"
};
} // namespace field


// ---------------------------------------------------------------------
// Operation table
// ---------------------------------------------------------------------
//
// One entry per remote operation the engine issues: the capability that
// serves it, the ordered method-name aliases and the per-call timeout.
// Request fields are filled by the step issuing the operation.
//
namespace method {
inline constexpr std::string_view CONNECT_EX[]     = {"ConnectEx"};
inline constexpr std::string_view CONNECT[]        = {"Connect"};
inline constexpr std::string_view OPEN_SESSION[]   = {"OpenSession", "SessionOpen"};
inline constexpr std::string_view TERMINAL_LOGIN[] = {"TerminalLogin", "Login"};
inline constexpr std::string_view IS_ALIVE[]       = {"IsAlive", "Ping"};
inline constexpr std::string_view PING[]           = {"Ping", "IsAlive"};
inline constexpr std::string_view LOGOUT[]         = {"Logout", "SessionClose", "CloseSession"};
inline constexpr std::string_view LOGIN[]          = {"Login", "AccountLogin", "UserLogin", "OpenSession", "SessionOpen", "TerminalLogin"};
inline constexpr std::string_view SERVER_TIME[]    = {"ServerTime", "TimeCurrent"};
inline constexpr std::string_view SYMBOLS_TOTAL[]  = {"SymbolsTotal"};
inline constexpr std::string_view OPENED_TICKETS[] = {"OpenedOrdersTickets", "OpenedTickets"};
inline constexpr std::string_view SYMBOL_TICK[]    = {"SymbolInfoTick"};
inline constexpr std::string_view ACCOUNT_SUMMARY[] = {"AccountSummary"};
} // namespace method

// Per-call timeout class; the configured value for each class is used
enum class Timeout : std::uint8_t {
    Connect,     // connect strategies (config timeout, 60 s)
    Handshake,   // open-session, terminal-login, login fallback (10 s)
    Ping,        // is-alive, helper ping (5 s)
    Logout,      // teardown logout (3 s)
    Probe        // readiness / keep-alive probes (3 s)
};

struct Operation {
    std::string_view name;
    std::string_view capability;
    Aliases methods;
    Timeout timeout;
};

namespace op {
inline constexpr Operation CONNECT_EX     {"connect-ex",        CONNECTION,     method::CONNECT_EX,     Timeout::Connect};
inline constexpr Operation CONNECT        {"connect",           CONNECTION,     method::CONNECT,        Timeout::Connect};
inline constexpr Operation OPEN_SESSION   {"open-session",      SESSION,        method::OPEN_SESSION,   Timeout::Handshake};
inline constexpr Operation TERMINAL_LOGIN {"terminal-login",    TERMINAL,       method::TERMINAL_LOGIN, Timeout::Handshake};
inline constexpr Operation IS_ALIVE       {"terminal-is-alive", TERMINAL,       method::IS_ALIVE,       Timeout::Ping};
inline constexpr Operation HELPER_PING    {"helper-ping",       ACCOUNT_HELPER, method::PING,           Timeout::Ping};
inline constexpr Operation LOGOUT         {"logout",            ACCOUNT,        method::LOGOUT,         Timeout::Logout};
} // namespace op


// ---------------------------------------------------------------------
// Probe table (readiness and keep-alive)
// ---------------------------------------------------------------------
//
// Cheap, side-effect-free calls. A probe names every capability that may
// serve it; the first attached one exposing a method alias is used.
//
enum class ProbeArgs : std::uint8_t {
    None,
    SelectedOnlyFalse,   // selected_only = false
    BaseSymbol           // symbol = configured base symbol
};

struct Probe {
    std::string_view name;
    std::array<std::string_view, 2> capabilities;   // empty entries unused
    Aliases methods;
    ProbeArgs args;
    bool readiness;                                   // used by the readiness loop
    bool keepalive;                                   // used by ensure_connected()
};

inline constexpr std::array<Probe, 5> PROBES = {{
    {"server-time",     {MARKET_INFO, {}},           method::SERVER_TIME,     ProbeArgs::None,              true,  true },
    {"symbols-total",   {MARKET_INFO, SYMBOLS},      method::SYMBOLS_TOTAL,   ProbeArgs::SelectedOnlyFalse, true,  true },
    {"opened-tickets",  {ACCOUNT_HELPER, {}},        method::OPENED_TICKETS,  ProbeArgs::None,              true,  false},
    {"symbol-tick",     {MARKET_INFO, {}},           method::SYMBOL_TICK,     ProbeArgs::BaseSymbol,        true,  false},
    {"account-summary", {ACCOUNT_HELPER, {}},        method::ACCOUNT_SUMMARY, ProbeArgs::None,              false, true },
}};

} // namespace termlink::core::catalog
