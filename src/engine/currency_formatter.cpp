#include "engine/currency_formatter.hpp"

#include <cmath>

#include <QLocale>
#include <QString>

namespace timeledger {

namespace {

QLocale localeForTag(const std::string &tag)
{
    QString name = QString::fromStdString(tag);
    name.replace(QLatin1Char('-'), QLatin1Char('_'));
    // QLocale maps names it does not know to the C locale.
    return QLocale(name);
}

} // namespace

std::string formatCurrency(double amount,
                           const std::string &currencyCode,
                           const std::string &localeTag)
{
    if (!std::isfinite(amount)) {
        amount = 0.0;
    }
    const QLocale locale = localeForTag(localeTag);
    const QString code = QString::fromStdString(currencyCode).toUpper();

    QString symbol = code;
    if (locale.currencySymbol(QLocale::CurrencyIsoCode) == code) {
        symbol = locale.currencySymbol(QLocale::CurrencySymbol);
    }
    return locale.toCurrencyString(amount, symbol, 2).toStdString();
}

std::string formatCurrency(double amount, const WorkspaceSettings &settings)
{
    return formatCurrency(amount, settings.currency, settings.currencyLocale);
}

} // namespace timeledger
