#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "engine/chart_scaler.hpp"
#include "engine/legend_summarizer.hpp"
#include "engine/report_engine.hpp"

namespace {

timeledger::MonthlyAggregate makeMonth(int month,
                                       std::vector<timeledger::ProjectHours> breakdown)
{
    timeledger::MonthlyAggregate aggregate;
    aggregate.month = month;
    for (const auto &item : breakdown) {
        aggregate.totalHours += item.hours;
    }
    aggregate.projectBreakdown = std::move(breakdown);
    return aggregate;
}

timeledger::TimeEntry makeEntry(const char *projectId, const QDate &date,
                                const char *start, const char *end)
{
    timeledger::TimeEntry entry;
    entry.id = std::string(projectId) + "-" + start;
    entry.projectId = projectId;
    entry.date = date;
    entry.startTime = start;
    entry.endTime = end;
    return entry;
}

timeledger::Project makeProject(const char *id, const char *name, const char *color)
{
    timeledger::Project project;
    project.id = id;
    project.name = name;
    project.color = color;
    project.client = std::string("Acme");
    return project;
}

} // namespace

class ChartLegendTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();

    void testBarsShareOneScale();
    void testScaleNeverBelowOneHour();
    void testFractionsStayInRange();
    void testLegendOrderAndTies();
    void testLegendSkipsUnknownProjects();
    void testComputeReportAgreesWithParts();

private:
    QTemporaryDir m_logDir;
};

void ChartLegendTests::initTestCase()
{
    QVERIFY(m_logDir.isValid());
    qputenv("TIMELEDGER_LOG_DIR", m_logDir.path().toUtf8());
}

void ChartLegendTests::testBarsShareOneScale()
{
    const std::vector<timeledger::MonthlyAggregate> months = {
        makeMonth(1, {{"a", "A", "#111111", 10.0}}),
        makeMonth(2, {{"a", "A", "#111111", 5.0}, {"b", "B", "#222222", 2.5}}),
    };

    const auto series = timeledger::scaleChart(months);
    QCOMPARE(series.scaleHours, 10.0);
    QCOMPARE(series.bars.size(), static_cast<size_t>(2));
    QCOMPARE(series.bars[0].segments.front().fraction, 1.0);
    QCOMPARE(series.bars[1].segments[0].fraction, 0.5);
    QCOMPARE(series.bars[1].segments[1].fraction, 0.25);
    QCOMPARE(series.bars[1].totalHours, 7.5);
}

void ChartLegendTests::testScaleNeverBelowOneHour()
{
    const std::vector<timeledger::MonthlyAggregate> months = {
        makeMonth(1, {{"a", "A", "#111111", 0.5}}),
        makeMonth(2, {}),
    };

    const auto series = timeledger::scaleChart(months);
    QCOMPARE(series.scaleHours, 1.0);
    QCOMPARE(series.bars[0].segments.front().fraction, 0.5);
    QVERIFY(series.bars[1].segments.empty());

    const auto empty = timeledger::scaleChart({});
    QCOMPARE(empty.scaleHours, 1.0);
    QVERIFY(empty.bars.empty());
}

void ChartLegendTests::testFractionsStayInRange()
{
    std::vector<timeledger::MonthlyAggregate> months;
    for (int month = 1; month <= 12; ++month) {
        months.push_back(makeMonth(month, {{"a", "A", "#111111", month * 1.5},
                                           {"b", "B", "#222222", 13.0 - month}}));
    }

    const auto series = timeledger::scaleChart(months);
    for (const auto &bar : series.bars) {
        double stacked = 0.0;
        for (const auto &segment : bar.segments) {
            QVERIFY(segment.fraction >= 0.0);
            QVERIFY(segment.fraction <= 1.0);
            stacked += segment.fraction;
        }
        QVERIFY(stacked <= 1.0 + 1e-9);
    }
}

void ChartLegendTests::testLegendOrderAndTies()
{
    const std::vector<timeledger::Project> projects = {
        makeProject("p1", "First", "#111111"),
        makeProject("p2", "Second", "#222222"),
        makeProject("p3", "Third", "#333333"),
    };
    const std::vector<timeledger::TimeEntry> entries = {
        makeEntry("p2", QDate(2024, 1, 1), "09:00", "10:00"),
        makeEntry("p1", QDate(2024, 1, 2), "09:00", "10:00"),
        makeEntry("p3", QDate(2024, 1, 3), "09:00", "12:00"),
    };

    const auto legend = timeledger::summarizeLegend(entries, projects);
    QCOMPARE(legend.size(), static_cast<size_t>(3));
    QCOMPARE(QString::fromStdString(legend[0].projectId), QStringLiteral("p3"));
    QCOMPARE(legend[0].totalHours, 3.0);
    // Equal totals keep first-seen order.
    QCOMPARE(QString::fromStdString(legend[1].projectId), QStringLiteral("p2"));
    QCOMPARE(QString::fromStdString(legend[2].projectId), QStringLiteral("p1"));
    QCOMPARE(QString::fromStdString(legend[2].color), QStringLiteral("#111111"));
}

void ChartLegendTests::testLegendSkipsUnknownProjects()
{
    const std::vector<timeledger::Project> projects = {makeProject("p1", "First", "#111111")};
    const std::vector<timeledger::TimeEntry> entries = {
        makeEntry("ghost", QDate(2024, 1, 1), "09:00", "17:00"),
        makeEntry("p1", QDate(2024, 1, 2), "09:00", "09:30"),
    };

    const auto legend = timeledger::summarizeLegend(entries, projects);
    QCOMPARE(legend.size(), static_cast<size_t>(1));
    QCOMPARE(legend.front().totalHours, 0.5);
}

void ChartLegendTests::testComputeReportAgreesWithParts()
{
    timeledger::WorkspaceSnapshot snapshot;
    snapshot.clients = {{"Acme", "Acme", "#ff0000"}};
    snapshot.projects = {
        makeProject("p1", "First", "#111111"),
        makeProject("p2", "Second", "#222222"),
    };
    snapshot.entries = {
        makeEntry("p1", QDate(2024, 1, 2), "09:00", "13:00"),
        makeEntry("p2", QDate(2024, 2, 2), "09:00", "11:00"),
        makeEntry("p2", QDate(2023, 2, 2), "09:00", "11:00"),
    };

    timeledger::FilterCriteria criteria;
    criteria.year = 2024;
    criteria.client = timeledger::ClientSelector::client("Acme");
    criteria.selectedProjectIds = {"p1", "p2", "stale"};

    const auto view = timeledger::computeReport(snapshot, criteria);
    QCOMPARE(view.availableProjects.size(), static_cast<size_t>(2));
    QCOMPARE(view.activeProjectIds.size(), static_cast<size_t>(2));
    QCOMPARE(view.year.grandTotalHours, 6.0);
    QCOMPARE(view.chart.scaleHours, 4.0);
    QCOMPARE(view.chart.bars[1].segments.front().fraction, 0.5);
    QCOMPARE(view.legend.size(), static_cast<size_t>(2));
    QCOMPARE(view.legend.front().totalHours, 4.0);
}

QTEST_MAIN(ChartLegendTests)
#include "test_chart_legend.moc"
