#pragma once

#include <string>

#include "common/models.hpp"

namespace timeledger {

// Renders amount in the given ISO 4217 currency using the conventions of a
// BCP 47 locale tag such as "fr-FR". Unknown tags fall back to the C locale.
std::string formatCurrency(double amount,
                           const std::string &currencyCode,
                           const std::string &localeTag);

std::string formatCurrency(double amount, const WorkspaceSettings &settings);

} // namespace timeledger
