#include "engine/filter_resolver.hpp"

#include <algorithm>
#include <iterator>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace timeledger {

namespace {

// Case-insensitive first so "acme" and "Acme" sit together, then exact order
// so the result does not depend on the process locale.
int compareNames(const std::string &a, const std::string &b)
{
    const QString left = QString::fromStdString(a);
    const QString right = QString::fromStdString(b);
    const int folded = left.compare(right, Qt::CaseInsensitive);
    if (folded != 0) {
        return folded;
    }
    return left.compare(right, Qt::CaseSensitive);
}

const Client *findClient(const std::vector<Client> &clients, const std::string &id)
{
    const auto it = std::find_if(clients.begin(), clients.end(),
                                 [&id](const Client &client) { return client.id == id; });
    return it == clients.end() ? nullptr : &*it;
}

} // namespace

std::vector<Project> FilterResolver::availableProjects(const std::vector<Project> &projects,
                                                       const std::vector<Client> &clients,
                                                       const ClientSelector &selector)
{
    std::vector<Project> result;
    switch (selector.scope) {
    case ClientScope::All:
        result = projects;
        break;
    case ClientScope::Unassigned:
        std::copy_if(projects.begin(), projects.end(), std::back_inserter(result),
                     [](const Project &project) { return !project.client.has_value(); });
        break;
    case ClientScope::Client:
        // A client that no longer exists selects nothing.
        if (const Client *client = findClient(clients, selector.clientId)) {
            std::copy_if(projects.begin(), projects.end(), std::back_inserter(result),
                         [client](const Project &project) {
                             return project.client.has_value() && *project.client == client->name;
                         });
        }
        break;
    }

    std::stable_sort(result.begin(), result.end(), [](const Project &a, const Project &b) {
        if (a.client.has_value() != b.client.has_value()) {
            return a.client.has_value();
        }
        if (a.client.has_value()) {
            const int byClient = compareNames(*a.client, *b.client);
            if (byClient != 0) {
                return byClient < 0;
            }
        }
        return compareNames(a.name, b.name) < 0;
    });
    return result;
}

std::set<std::string> FilterResolver::reconcile(const std::set<std::string> &chosen,
                                                const std::vector<Project> &available)
{
    std::set<std::string> active;
    for (const auto &project : available) {
        if (chosen.count(project.id) > 0) {
            active.insert(project.id);
        }
    }
    if (active.size() != chosen.size()) {
        TLOG_DEBUG(QStringLiteral("FilterResolver"),
                   QStringLiteral("reconcile"),
                   QStringLiteral("stale_selection_dropped"),
                   QStringLiteral("client_filter_changed"),
                   QStringLiteral("intersect_available"),
                   timeledger::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"chosen", chosen.size()},
                                   {"active", active.size()}}));
    }
    return active;
}

ProjectScope FilterResolver::resolve(const std::vector<Project> &projects,
                                     const std::vector<Client> &clients,
                                     const ClientSelector &selector,
                                     const std::set<std::string> &chosen)
{
    ProjectScope scope;
    scope.availableProjects = availableProjects(projects, clients, selector);
    scope.activeProjectIds = reconcile(chosen, scope.availableProjects);
    return scope;
}

std::set<std::string> FilterResolver::defaultSelection(const std::vector<Project> &available)
{
    std::set<std::string> ids;
    for (const auto &project : available) {
        ids.insert(project.id);
    }
    return ids;
}

std::set<std::string> FilterResolver::toggleProject(const std::set<std::string> &selection,
                                                    const std::string &projectId)
{
    std::set<std::string> next = selection;
    if (next.erase(projectId) == 0) {
        next.insert(projectId);
    }
    return next;
}

std::set<std::string> FilterResolver::toggleAllProjects(const std::set<std::string> &selection,
                                                        const std::vector<Project> &available)
{
    const std::set<std::string> all = defaultSelection(available);
    if (reconcile(selection, available).size() == all.size()) {
        return {};
    }
    return all;
}

std::vector<Project> FilterResolver::selectableProjects(const std::vector<Project> &projects)
{
    std::vector<Project> result;
    std::copy_if(projects.begin(), projects.end(), std::back_inserter(result),
                 [](const Project &project) { return project.active; });
    std::stable_sort(result.begin(), result.end(), [](const Project &a, const Project &b) {
        return compareNames(a.name, b.name) < 0;
    });
    return result;
}

std::string FilterResolver::clientFilterDisplayName(const ClientSelector &selector,
                                                    const std::vector<Client> &clients)
{
    switch (selector.scope) {
    case ClientScope::All:
        return "All Clients";
    case ClientScope::Unassigned:
        return "Internal / No Client";
    case ClientScope::Client:
        if (const Client *client = findClient(clients, selector.clientId)) {
            return client->name;
        }
        return "Unknown Client";
    }
    return "All Clients";
}

std::string FilterResolver::invoiceFilterDisplayName(InvoiceFilter filter)
{
    switch (filter) {
    case InvoiceFilter::All:
        return "All Statuses";
    case InvoiceFilter::Invoiced:
        return "Invoiced Only";
    case InvoiceFilter::NotInvoiced:
        return "Not Invoiced Only";
    }
    return "All Statuses";
}

} // namespace timeledger
