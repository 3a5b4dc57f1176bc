#include "termlink/core/catalog/catalog.hpp"

#include "mt5_term_api/connection.pb.h"
#include "mt5_term_api/account.pb.h"
#include "mt5_term_api/account_helper.pb.h"
#include "mt5_term_api/market_info.pb.h"
#include "mt5_term_api/symbols.pb.h"
#include "mt5_term_api/charts.pb.h"
#include "mt5_term_api/market_book.pb.h"
#include "mt5_term_api/trade_functions.pb.h"
#include "mt5_term_api/auth.pb.h"
#ifndef TERMLINK_LITE_API
#include "mt5_term_api/session.pb.h"
#include "mt5_term_api/terminal.pb.h"
#endif


namespace termlink::core::catalog {

// Generated descriptors register themselves from static initializers. Objects
// of a static library nobody references are dropped by the linker, so each
// module is referenced once here.
void link_modules() noexcept {
    static const void* const anchors[] = {
        &mt5_term_api::ConnectRequest::default_instance(),
        &mt5_term_api::LoginRequest::default_instance(),
        &mt5_term_api::PingRequest::default_instance(),
        &mt5_term_api::ServerTimeRequest::default_instance(),
        &mt5_term_api::SymbolCountRequest::default_instance(),
        &mt5_term_api::CopyRatesRequest::default_instance(),
        &mt5_term_api::MarketBookRequest::default_instance(),
        &mt5_term_api::PositionsTotalRequest::default_instance(),
        &mt5_term_api::UserLoginRequest::default_instance(),
#ifndef TERMLINK_LITE_API
        &mt5_term_api::OpenSessionRequest::default_instance(),
        &mt5_term_api::TerminalLoginRequest::default_instance(),
#endif
    };
    (void)anchors;
}

} // namespace termlink::core::catalog
