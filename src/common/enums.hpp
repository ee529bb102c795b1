#pragma once

namespace timeledger {

enum class CostCategory {
    License,
    Server,
    Domain
};

enum class InvoiceFilter {
    All,
    Invoiced,
    NotInvoiced
};

enum class ClientScope {
    All,
    Client,
    Unassigned
};

} // namespace timeledger
