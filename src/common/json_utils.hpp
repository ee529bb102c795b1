#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include <QDate>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace timeledger {

inline std::string toIsoDate(const QDate &date)
{
    if (!date.isValid()) {
        return {};
    }
    return date.toString(Qt::ISODate).toStdString();
}

// Accepts "yyyy-MM-dd" or a full ISO-8601 timestamp; only the date part counts.
inline QDate fromIsoDate(const std::string &value)
{
    if (value.size() < 10) {
        return {};
    }
    return QDate::fromString(QString::fromStdString(value.substr(0, 10)), Qt::ISODate);
}

inline std::string toInvoiceFilterString(InvoiceFilter filter)
{
    switch (filter) {
    case InvoiceFilter::All:
        return "all";
    case InvoiceFilter::Invoiced:
        return "invoiced";
    case InvoiceFilter::NotInvoiced:
        return "not-invoiced";
    }
    return "all";
}

inline std::optional<InvoiceFilter> parseInvoiceFilterString(const std::string &value)
{
    if (value == "all") {
        return InvoiceFilter::All;
    }
    if (value == "invoiced") {
        return InvoiceFilter::Invoiced;
    }
    if (value == "not-invoiced") {
        return InvoiceFilter::NotInvoiced;
    }
    return std::nullopt;
}

inline std::string toCategoryString(CostCategory category)
{
    switch (category) {
    case CostCategory::License:
        return "licenses";
    case CostCategory::Server:
        return "servers";
    case CostCategory::Domain:
        return "domains";
    }
    return "licenses";
}

inline void to_json(nlohmann::json &j, const WorkspaceSettings &settings)
{
    j = nlohmann::json{
        {"currency", settings.currency},
        {"currencyLocale", settings.currencyLocale}
    };
}

inline void from_json(const nlohmann::json &j, WorkspaceSettings &settings)
{
    settings.currency = j.value("currency", "USD");
    settings.currencyLocale = j.value("currencyLocale", "en-US");
}

inline void to_json(nlohmann::json &j, const Client &client)
{
    j = nlohmann::json{
        {"id", client.id},
        {"name", client.name},
        {"color", client.color}
    };
}

inline void from_json(const nlohmann::json &j, Client &client)
{
    client.name = j.value("name", "");
    client.id = j.value("id", client.name);
    client.color = j.value("color", "#6b7280");
}

inline void to_json(nlohmann::json &j, const Project &project)
{
    j = nlohmann::json{
        {"id", project.id},
        {"name", project.name},
        {"color", project.color},
        {"active", project.active}
    };
    if (project.client.has_value()) {
        j["client"] = *project.client;
    }
    if (project.rate.has_value()) {
        j["rate"] = *project.rate;
    }
}

inline void from_json(const nlohmann::json &j, Project &project)
{
    project.id = j.value("id", "");
    project.name = j.value("name", "");
    project.color = j.value("color", "");
    project.active = j.value("active", true);
    if (j.contains("client") && j.at("client").is_string()
        && !j.at("client").get<std::string>().empty()) {
        project.client = j.at("client").get<std::string>();
    } else {
        project.client.reset();
    }
    if (j.contains("rate") && j.at("rate").is_number()) {
        project.rate = std::max(0.0, j.at("rate").get<double>());
    } else {
        project.rate.reset();
    }
}

inline void to_json(nlohmann::json &j, const TimeEntry &entry)
{
    j = nlohmann::json{
        {"id", entry.id},
        {"description", entry.description},
        {"project", entry.projectId},
        {"date", toIsoDate(entry.date)},
        {"startTime", entry.startTime},
        {"endTime", entry.endTime},
        {"billable", entry.billable},
        {"invoiced", entry.invoiced}
    };
}

inline void from_json(const nlohmann::json &j, TimeEntry &entry)
{
    entry.id = j.value("id", "");
    entry.description = j.value("description", "");
    entry.projectId = j.value("project", "");
    entry.date = fromIsoDate(j.value("date", ""));
    entry.startTime = j.value("startTime", "");
    entry.endTime = j.value("endTime", "");
    entry.billable = j.value("billable", true);
    // An entry that is not billable can never be invoiced.
    entry.invoiced = entry.billable && j.value("invoiced", false);
}

inline void to_json(nlohmann::json &j, const CostItem &item)
{
    j = nlohmann::json{
        {"id", item.id},
        {"name", item.name},
        {"price", item.price},
        {"project", item.projectId},
        {"client", item.clientName},
        {"date", toIsoDate(item.date)},
        {"invoiced", item.invoiced},
        {"notes", item.notes}
    };
}

inline void from_json(const nlohmann::json &j, CostItem &item)
{
    item.id = j.value("id", "");
    item.name = j.value("name", "");
    if (j.contains("price") && j.at("price").is_number()) {
        item.price = std::max(0.0, j.at("price").get<double>());
    } else {
        item.price = 0.0;
    }
    item.projectId = j.value("project", "");
    item.clientName = j.value("client", "");
    item.date = fromIsoDate(j.value("date", ""));
    item.invoiced = j.value("invoiced", false);
    item.notes = j.value("notes", "");
}

inline void to_json(nlohmann::json &j, const WorkspaceSnapshot &snapshot)
{
    j = nlohmann::json{
        {"settings", snapshot.settings},
        {"clients", snapshot.clients},
        {"projects", snapshot.projects},
        {"entries", snapshot.entries},
        {"licenses", snapshot.licenses},
        {"servers", snapshot.servers},
        {"domains", snapshot.domains}
    };
}

template<typename T>
void readArray(const nlohmann::json &j, const char *key, std::vector<T> &out)
{
    out.clear();
    if (j.contains(key) && j.at(key).is_array()) {
        out = j.at(key).get<std::vector<T>>();
    }
}

inline void from_json(const nlohmann::json &j, WorkspaceSnapshot &snapshot)
{
    if (j.contains("settings") && j.at("settings").is_object()) {
        snapshot.settings = j.at("settings").get<WorkspaceSettings>();
    } else {
        snapshot.settings = WorkspaceSettings{};
    }
    readArray(j, "clients", snapshot.clients);
    readArray(j, "projects", snapshot.projects);
    readArray(j, "entries", snapshot.entries);
    readArray(j, "licenses", snapshot.licenses);
    readArray(j, "servers", snapshot.servers);
    readArray(j, "domains", snapshot.domains);
}

inline void to_json(nlohmann::json &j, const DayGroup &day)
{
    j = nlohmann::json{
        {"date", toIsoDate(day.date)},
        {"totalMinutes", day.totalMinutes},
        {"entries", day.entries}
    };
}

inline void to_json(nlohmann::json &j, const WeekGroup &week)
{
    j = nlohmann::json{
        {"start", toIsoDate(week.start)},
        {"end", toIsoDate(week.end)},
        {"totalMinutes", week.totalMinutes},
        {"days", week.days}
    };
}

inline void to_json(nlohmann::json &j, const ProjectHours &hours)
{
    j = nlohmann::json{
        {"projectId", hours.projectId},
        {"name", hours.name},
        {"color", hours.color},
        {"hours", hours.hours}
    };
}

inline void to_json(nlohmann::json &j, const MonthlyAggregate &month)
{
    j = nlohmann::json{
        {"month", month.month},
        {"totalHours", month.totalHours},
        {"hoursAmount", month.hoursAmount},
        {"licenseAmount", month.licenseAmount},
        {"serverAmount", month.serverAmount},
        {"domainAmount", month.domainAmount},
        {"totalAmount", month.totalAmount},
        {"entryCount", month.entryCount},
        {"projectBreakdown", month.projectBreakdown}
    };
}

inline void to_json(nlohmann::json &j, const YearReport &report)
{
    j = nlohmann::json{
        {"year", report.year},
        {"months", report.months},
        {"grandTotalHours", report.grandTotalHours},
        {"grandTotalAmount", report.grandTotalAmount},
        {"hoursAmountTotal", report.hoursAmountTotal},
        {"licenseAmountTotal", report.licenseAmountTotal},
        {"serverAmountTotal", report.serverAmountTotal},
        {"domainAmountTotal", report.domainAmountTotal}
    };
}

inline void to_json(nlohmann::json &j, const LegendItem &item)
{
    j = nlohmann::json{
        {"id", item.projectId},
        {"name", item.name},
        {"color", item.color},
        {"totalHours", item.totalHours}
    };
}

} // namespace timeledger
