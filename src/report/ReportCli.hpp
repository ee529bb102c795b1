#pragma once

#include <optional>

#include <QDateTime>
#include <QString>
#include <QStringList>

#include "common/models.hpp"

namespace timeledger {

class ReportCli
{
public:
    // Subcommand dispatcher; returns the process exit code.
    int run(int argc, char *argv[]);

    // Fixes the "Generated:" stamp of exported ledgers; the current local
    // time is used when unset.
    void setGeneratedAt(const QDateTime &generatedAt) { m_generatedAt = generatedAt; }

private:
    int runFeedReport(const QStringList &args);
    int runSummaryReport(const QStringList &args);
    int runExportReport(const QStringList &args);

    std::optional<WorkspaceSnapshot> loadInput(const QStringList &args) const;
    std::optional<FilterCriteria> parseCriteria(const QStringList &args,
                                                const WorkspaceSnapshot &snapshot) const;

    QDateTime m_generatedAt;
};

} // namespace timeledger
