#pragma once

#include <string>
#include <vector>

#include <QDateTime>

#include "common/models.hpp"

namespace timeledger {

/**
 * Render the flat-text ledger for criteria.year.
 *
 * Entries are scoped exactly like the monthly report (year, reconciled
 * project set, invoice status) and listed oldest first, grouped
 * client -> project, with one ">>> TOTAL PROJECT:" line per project and a
 * final "GRAND TOTAL:" line. Entries whose project is not in the catalog
 * are never in scope, since reconciliation drops their ids. The section
 * markers are parsed by downstream tools and must not change.
 */
std::string renderLedger(const WorkspaceSnapshot &snapshot,
                         const FilterCriteria &criteria,
                         const QDateTime &generatedAt);

// Report_<year>_<All|client id|no-client>_<invoice filter>.txt
std::string suggestedLedgerFileName(const FilterCriteria &criteria);

} // namespace timeledger
