#pragma once

#include <string>
#include <vector>

#include "messaging/protocol.hpp"
#include "service/ledger_service.hpp"

namespace lotledger::messaging {

/// Maps inbound LedgerMessages onto LedgerService calls and builds the
/// replies. Installed as the ZmqServer handler.
class RequestRouter {
public:
    explicit RequestRouter(service::LedgerService& ledger);

    std::vector<ledgerwire::LedgerMessage> handle(const std::string& client_id,
                                                  const ledgerwire::LedgerMessage& msg);

private:
    std::vector<ledgerwire::LedgerMessage> on_record_transaction(
        const std::string& client_id, const ledgerwire::LedgerMessage& msg);
    std::vector<ledgerwire::LedgerMessage> on_snapshot_request(
        const std::string& client_id, const ledgerwire::LedgerMessage& msg);
    std::vector<ledgerwire::LedgerMessage> on_position_request(
        const std::string& client_id, const ledgerwire::LedgerMessage& msg);

    service::LedgerService& ledger_;
};

}  // namespace lotledger::messaging
