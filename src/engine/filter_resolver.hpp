#pragma once

#include <set>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace timeledger {

struct ProjectScope {
    // Sorted by client name then project name; projects without a client last.
    std::vector<Project> availableProjects;
    // Always a subset of the ids in availableProjects.
    std::set<std::string> activeProjectIds;
};

class FilterResolver
{
public:
    static std::vector<Project> availableProjects(const std::vector<Project> &projects,
                                                  const std::vector<Client> &clients,
                                                  const ClientSelector &selector);

    // Drops every chosen id that is not available under the current client filter.
    static std::set<std::string> reconcile(const std::set<std::string> &chosen,
                                           const std::vector<Project> &available);

    static ProjectScope resolve(const std::vector<Project> &projects,
                                const std::vector<Client> &clients,
                                const ClientSelector &selector,
                                const std::set<std::string> &chosen);

    // Selection to apply whenever the client filter changes.
    static std::set<std::string> defaultSelection(const std::vector<Project> &available);

    static std::set<std::string> toggleProject(const std::set<std::string> &selection,
                                               const std::string &projectId);

    // Clears the selection when every available project is selected, otherwise selects all.
    static std::set<std::string> toggleAllProjects(const std::set<std::string> &selection,
                                                   const std::vector<Project> &available);

    // Active projects by name, for the project picker.
    static std::vector<Project> selectableProjects(const std::vector<Project> &projects);

    static std::string clientFilterDisplayName(const ClientSelector &selector,
                                               const std::vector<Client> &clients);

    // "All Statuses", "Invoiced Only" or "Not Invoiced Only".
    static std::string invoiceFilterDisplayName(InvoiceFilter filter);
};

} // namespace timeledger
