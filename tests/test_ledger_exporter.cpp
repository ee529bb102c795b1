#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "engine/ledger_exporter.hpp"

namespace {

timeledger::TimeEntry makeEntry(const char *id, const char *projectId, const QDate &date,
                                const char *start, const char *end,
                                const char *description, bool invoiced = false)
{
    timeledger::TimeEntry entry;
    entry.id = id;
    entry.projectId = projectId;
    entry.date = date;
    entry.startTime = start;
    entry.endTime = end;
    entry.description = description;
    entry.invoiced = invoiced;
    return entry;
}

timeledger::Project makeProject(const char *id, const char *name,
                                std::optional<std::string> client)
{
    timeledger::Project project;
    project.id = id;
    project.name = name;
    project.client = std::move(client);
    project.color = "#3b82f6";
    return project;
}

timeledger::WorkspaceSnapshot ledgerWorkspace()
{
    timeledger::WorkspaceSnapshot snapshot;
    snapshot.clients = {{"acme", "Acme", "#ff0000"}};
    snapshot.projects = {
        makeProject("p-web", "Website", std::string("Acme")),
        makeProject("p-app", "App", std::string("Acme")),
        makeProject("p-int", "Tooling", std::nullopt),
    };
    snapshot.entries = {
        makeEntry("e1", "p-web", QDate(2024, 3, 12), "14:00", "15:30", "Deploy"),
        makeEntry("e2", "p-web", QDate(2024, 3, 12), "09:00", "11:00", "Landing page", true),
        makeEntry("e3", "p-app", QDate(2024, 2, 1), "10:00", "10:45", ""),
        makeEntry("e4", "p-int", QDate(2024, 5, 6), "08:00", "09:00", "CI"),
        makeEntry("e5", "p-web", QDate(2023, 12, 30), "09:00", "17:00", "Last year"),
    };
    return snapshot;
}

const QDateTime kGeneratedAt(QDate(2024, 6, 1), QTime(9, 5));

} // namespace

class LedgerExporterTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();

    void testClientScopedLedger();
    void testAllClientsGroupsInternalWork();
    void testEmptyLedger();
    void testDanglingEntriesAreLeftOut();
    void testSuggestedFileName();

private:
    QTemporaryDir m_logDir;
};

void LedgerExporterTests::initTestCase()
{
    QVERIFY(m_logDir.isValid());
    qputenv("TIMELEDGER_LOG_DIR", m_logDir.path().toUtf8());
}

void LedgerExporterTests::testClientScopedLedger()
{
    timeledger::FilterCriteria criteria;
    criteria.year = 2024;
    criteria.client = timeledger::ClientSelector::client("acme");
    criteria.selectedProjectIds = {"p-web", "p-app", "p-int"};

    const std::string expected =
        "REPORT EXPORT - 2024\n"
        "Client Filter: Acme\n"
        "Billing Status: All Statuses\n"
        "Generated: 01/06/2024 09:05\n"
        "=================================================================\n"
        "\n"
        "CLIENT: Acme\n"
        "-----------------------------------------------------------------\n"
        "  PROJECT: App\n"
        "    01/02/2024 | 10:00 - 10:45 | 0.75h\n"
        "    >>> TOTAL PROJECT: 0.75 hours\n"
        "\n"
        "  PROJECT: Website\n"
        "    12/03/2024 | 09:00 - 11:00 | 2.00h - Landing page [INVOICED]\n"
        "    12/03/2024 | 14:00 - 15:30 | 1.50h - Deploy\n"
        "    >>> TOTAL PROJECT: 3.50 hours\n"
        "\n"
        "\n"
        "=================================================================\n"
        "GRAND TOTAL: 4.25 hours\n";

    const std::string actual = timeledger::renderLedger(ledgerWorkspace(), criteria, kGeneratedAt);
    QCOMPARE(QString::fromStdString(actual), QString::fromStdString(expected));
}

void LedgerExporterTests::testAllClientsGroupsInternalWork()
{
    timeledger::FilterCriteria criteria;
    criteria.year = 2024;
    criteria.selectedProjectIds = {"p-web", "p-int"};
    criteria.invoiceStatus = timeledger::InvoiceFilter::NotInvoiced;

    const QString text = QString::fromStdString(
        timeledger::renderLedger(ledgerWorkspace(), criteria, kGeneratedAt));
    QVERIFY(text.contains(QStringLiteral("Client Filter: All Clients\n")));
    QVERIFY(text.contains(QStringLiteral("Billing Status: Not Invoiced Only\n")));
    QVERIFY(text.contains(QStringLiteral("CLIENT: No Client / Internal\n")));
    QVERIFY(text.contains(QStringLiteral("    06/05/2024 | 08:00 - 09:00 | 1.00h - CI\n")));
    QVERIFY(!text.contains(QStringLiteral("Landing page")));
    QVERIFY(!text.contains(QStringLiteral("PROJECT: App")));
    QVERIFY(!text.contains(QStringLiteral("Last year")));
    QVERIFY(text.indexOf(QStringLiteral("CLIENT: Acme"))
            < text.indexOf(QStringLiteral("CLIENT: No Client / Internal")));
    QVERIFY(text.endsWith(QStringLiteral("GRAND TOTAL: 2.50 hours\n")));
}

void LedgerExporterTests::testEmptyLedger()
{
    timeledger::FilterCriteria criteria;
    criteria.year = 2024;
    criteria.client = timeledger::ClientSelector::unassigned();
    criteria.invoiceStatus = timeledger::InvoiceFilter::Invoiced;

    const std::string expected =
        "REPORT EXPORT - 2024\n"
        "Client Filter: Internal / No Client\n"
        "Billing Status: Invoiced Only\n"
        "Generated: 01/06/2024 09:05\n"
        "=================================================================\n"
        "\n"
        "=================================================================\n"
        "GRAND TOTAL: 0.00 hours\n";

    const std::string actual = timeledger::renderLedger(ledgerWorkspace(), criteria, kGeneratedAt);
    QCOMPARE(QString::fromStdString(actual), QString::fromStdString(expected));
}

void LedgerExporterTests::testDanglingEntriesAreLeftOut()
{
    auto snapshot = ledgerWorkspace();
    snapshot.entries.push_back(
        makeEntry("e9", "p-deleted", QDate(2024, 4, 4), "09:00", "18:00", "Orphan"));

    timeledger::FilterCriteria criteria;
    criteria.year = 2024;
    criteria.selectedProjectIds = {"p-web", "p-app", "p-int", "p-deleted"};

    const QString text = QString::fromStdString(
        timeledger::renderLedger(snapshot, criteria, kGeneratedAt));
    QVERIFY(!text.contains(QStringLiteral("Orphan")));
    QVERIFY(text.endsWith(QStringLiteral("GRAND TOTAL: 5.25 hours\n")));
}

void LedgerExporterTests::testSuggestedFileName()
{
    timeledger::FilterCriteria criteria;
    criteria.year = 2024;
    QCOMPARE(QString::fromStdString(timeledger::suggestedLedgerFileName(criteria)),
             QStringLiteral("Report_2024_All_all.txt"));

    criteria.client = timeledger::ClientSelector::client("acme");
    criteria.invoiceStatus = timeledger::InvoiceFilter::NotInvoiced;
    QCOMPARE(QString::fromStdString(timeledger::suggestedLedgerFileName(criteria)),
             QStringLiteral("Report_2024_acme_not-invoiced.txt"));

    criteria.client = timeledger::ClientSelector::unassigned();
    criteria.invoiceStatus = timeledger::InvoiceFilter::Invoiced;
    QCOMPARE(QString::fromStdString(timeledger::suggestedLedgerFileName(criteria)),
             QStringLiteral("Report_2024_no-client_invoiced.txt"));
}

QTEST_MAIN(LedgerExporterTests)
#include "test_ledger_exporter.moc"
