#include "engine/workspace_loader.hpp"

#include <QFile>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace timeledger {

namespace {

void logRejected(const char *what, const std::string &detail)
{
    TLOG_ERROR(QStringLiteral("WorkspaceLoader"),
               QStringLiteral("parseWorkspaceSnapshot"),
               QString::fromLatin1(what),
               QStringLiteral("caller_contract"),
               QStringLiteral("reject_snapshot"),
               timeledger::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"detail", detail}}));
}

} // namespace

std::optional<WorkspaceSnapshot> parseWorkspaceSnapshot(const std::string &document)
{
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(document);
    } catch (const nlohmann::json::parse_error &ex) {
        logRejected("snapshot_parse_error", ex.what());
        return std::nullopt;
    }
    if (!root.is_object()) {
        logRejected("snapshot_not_object", root.type_name());
        return std::nullopt;
    }

    WorkspaceSnapshot snapshot;
    try {
        snapshot = root.get<WorkspaceSnapshot>();
    } catch (const nlohmann::json::exception &ex) {
        logRejected("snapshot_bad_shape", ex.what());
        return std::nullopt;
    }

    TLOG_INFO(QStringLiteral("WorkspaceLoader"),
              QStringLiteral("parseWorkspaceSnapshot"),
              QStringLiteral("snapshot_loaded"),
              QStringLiteral("report_request"),
              QStringLiteral("json_document"),
              timeledger::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"projects", snapshot.projects.size()},
                              {"clients", snapshot.clients.size()},
                              {"entries", snapshot.entries.size()},
                              {"licenses", snapshot.licenses.size()},
                              {"servers", snapshot.servers.size()},
                              {"domains", snapshot.domains.size()}}));
    return snapshot;
}

std::optional<WorkspaceSnapshot> loadWorkspaceSnapshot(const std::string &path)
{
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        logRejected("snapshot_unreadable", path);
        return std::nullopt;
    }
    return parseWorkspaceSnapshot(file.readAll().toStdString());
}

bool saveWorkspaceSnapshot(const WorkspaceSnapshot &snapshot, const std::string &path)
{
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray data = QByteArray::fromStdString(nlohmann::json(snapshot).dump(2));
    return file.write(data) == data.size();
}

} // namespace timeledger
