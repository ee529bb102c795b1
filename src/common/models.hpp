#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include <QDate>

#include "common/enums.hpp"

namespace timeledger {

struct TimeEntry {
    std::string id;
    std::string description;
    std::string projectId;
    QDate date;
    // Wall-clock "HH:MM"; an end before the start means the shift ended the next day.
    std::string startTime;
    std::string endTime;
    bool billable = true;
    bool invoiced = false;
};

// Shared shape of licenses, servers and domains. clientName must equal the
// referenced project's client name at write time.
struct CostItem {
    std::string id;
    std::string name;
    double price = 0.0;
    std::string projectId;
    std::string clientName;
    QDate date;
    bool invoiced = false;
    std::string notes;
};

struct Project {
    std::string id;
    std::string name;
    std::optional<std::string> client;
    std::string color;
    bool active = true;
    std::optional<double> rate;
};

struct Client {
    std::string id;
    std::string name;
    std::string color;
};

struct WorkspaceSettings {
    std::string currency = "USD";
    std::string currencyLocale = "en-US";
};

struct WorkspaceSnapshot {
    WorkspaceSettings settings;
    std::vector<Client> clients;
    std::vector<Project> projects;
    std::vector<TimeEntry> entries;
    std::vector<CostItem> licenses;
    std::vector<CostItem> servers;
    std::vector<CostItem> domains;

    const std::vector<CostItem> &costItems(CostCategory category) const
    {
        switch (category) {
        case CostCategory::License:
            return licenses;
        case CostCategory::Server:
            return servers;
        case CostCategory::Domain:
            return domains;
        }
        return licenses;
    }
};

struct ClientSelector {
    ClientScope scope = ClientScope::All;
    std::string clientId;

    static ClientSelector all() { return {}; }
    static ClientSelector unassigned() { return {ClientScope::Unassigned, {}}; }
    static ClientSelector client(const std::string &id) { return {ClientScope::Client, id}; }
};

struct FilterCriteria {
    int year = 0;
    ClientSelector client;
    std::set<std::string> selectedProjectIds;
    InvoiceFilter invoiceStatus = InvoiceFilter::All;
};

struct DayGroup {
    QDate date;
    std::vector<TimeEntry> entries;
    int totalMinutes = 0;
};

struct WeekGroup {
    QDate start;
    QDate end;
    std::vector<DayGroup> days;
    int totalMinutes = 0;
};

struct ProjectHours {
    std::string projectId;
    std::string name;
    std::string color;
    double hours = 0.0;
};

struct MonthlyAggregate {
    int month = 0;
    double totalHours = 0.0;
    double hoursAmount = 0.0;
    double licenseAmount = 0.0;
    double serverAmount = 0.0;
    double domainAmount = 0.0;
    double totalAmount = 0.0;
    int entryCount = 0;
    std::vector<ProjectHours> projectBreakdown;
};

struct YearReport {
    int year = 0;
    std::vector<MonthlyAggregate> months;
    double grandTotalHours = 0.0;
    double grandTotalAmount = 0.0;
    double hoursAmountTotal = 0.0;
    double licenseAmountTotal = 0.0;
    double serverAmountTotal = 0.0;
    double domainAmountTotal = 0.0;
};

struct LegendItem {
    std::string projectId;
    std::string name;
    std::string color;
    double totalHours = 0.0;
};

} // namespace timeledger
