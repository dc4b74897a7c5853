#include "honeywell_schema.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace phicore::honeywell::ipc {

namespace {

QJsonObject responsive(int xs, int sm, int md, int lg, int xl, int xxl)
{
    QJsonObject out;
    out.insert(QStringLiteral("xs"), xs);
    out.insert(QStringLiteral("sm"), sm);
    out.insert(QStringLiteral("md"), md);
    out.insert(QStringLiteral("lg"), lg);
    out.insert(QStringLiteral("xl"), xl);
    out.insert(QStringLiteral("xxl"), xxl);
    return out;
}

QJsonObject field(const QString &key,
                  const QString &type,
                  const QString &label,
                  const QString &description,
                  const QJsonValue &defaultValue = QJsonValue(),
                  const QJsonArray &flags = {})
{
    QJsonObject out;
    out.insert(QStringLiteral("key"), key);
    out.insert(QStringLiteral("type"), type);
    out.insert(QStringLiteral("label"), label);
    out.insert(QStringLiteral("description"), description);
    if (!defaultValue.isUndefined() && !defaultValue.isNull())
        out.insert(QStringLiteral("default"), defaultValue);
    if (!flags.isEmpty())
        out.insert(QStringLiteral("flags"), flags);
    return out;
}

QJsonArray credentialFields()
{
    QJsonArray fields;

    QJsonArray required;
    required.append(QStringLiteral("Required"));
    fields.append(field(QStringLiteral("username"),
                        QStringLiteral("String"),
                        QStringLiteral("Username"),
                        QStringLiteral("Total Connect Comfort account e-mail."),
                        QJsonValue(),
                        required));

    QJsonArray secret;
    secret.append(QStringLiteral("Required"));
    secret.append(QStringLiteral("Secret"));
    fields.append(field(QStringLiteral("password"),
                        QStringLiteral("Password"),
                        QStringLiteral("Password"),
                        QStringLiteral("Total Connect Comfort account password."),
                        QJsonValue(),
                        secret));
    return fields;
}

QJsonArray optionFields()
{
    QJsonArray fields;
    fields.append(field(QStringLiteral("pollIntervalSeconds"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Poll interval"),
                        QStringLiteral("Seconds between refreshes (10 to 3600)."),
                        QJsonValue(60)));
    fields.append(field(QStringLiteral("refreshTimeoutSeconds"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Refresh timeout"),
                        QStringLiteral("Seconds before a device refresh is given up."),
                        QJsonValue(30)));
    fields.append(field(QStringLiteral("awayTemperatureHeat"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Away heat temperature"),
                        QStringLiteral("Heat setpoint held while away."),
                        QJsonValue(61)));
    fields.append(field(QStringLiteral("awayTemperatureCool"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Away cool temperature"),
                        QStringLiteral("Cool setpoint held while away."),
                        QJsonValue(88)));
    return fields;
}

QJsonObject section(const QString &title, const QString &description, const QJsonArray &fields)
{
    QJsonObject layout;
    layout.insert(QStringLiteral("gridUnits"), 24);
    QJsonArray gutter;
    gutter.append(12);
    gutter.append(8);
    layout.insert(QStringLiteral("gutter"), gutter);

    QJsonObject defaults;
    defaults.insert(QStringLiteral("span"), responsive(24, 24, 12, 12, 12, 12));
    defaults.insert(QStringLiteral("labelPosition"), QStringLiteral("Left"));
    defaults.insert(QStringLiteral("labelSpan"), 8);
    defaults.insert(QStringLiteral("controlSpan"), 16);
    defaults.insert(QStringLiteral("actionPosition"), QStringLiteral("Inline"));
    defaults.insert(QStringLiteral("actionSpan"), 6);
    layout.insert(QStringLiteral("defaults"), defaults);

    QJsonObject out;
    out.insert(QStringLiteral("title"), title);
    out.insert(QStringLiteral("description"), description);
    out.insert(QStringLiteral("layout"), layout);
    out.insert(QStringLiteral("fields"), fields);
    return out;
}

phicore::adapter::v1::AdapterActionDescriptor action(const char *id,
                                                     const char *label,
                                                     const char *description,
                                                     const char *metaJson)
{
    phicore::adapter::v1::AdapterActionDescriptor out;
    out.id = id;
    out.label = label;
    out.description = description;
    out.metaJson = metaJson;
    return out;
}

} // namespace

phicore::adapter::v1::Utf8String displayName()
{
    return "Honeywell Total Connect Comfort";
}

phicore::adapter::v1::Utf8String description()
{
    return "Provides thermostats of a Honeywell Total Connect Comfort account";
}

phicore::adapter::v1::Utf8String iconSvg()
{
    return
        "<svg width=\"24\" height=\"24\" viewBox=\"0 0 24 24\" xmlns=\"http://www.w3.org/2000/svg\" role=\"img\" aria-label=\"Thermostat\">"
        "<circle cx=\"12\" cy=\"12\" r=\"10\" fill=\"none\" stroke=\"#D52B1E\" stroke-width=\"2\"/>"
        "<circle cx=\"12\" cy=\"12\" r=\"6\" fill=\"none\" stroke=\"#D52B1E\" stroke-width=\"1\"/>"
        "<text x=\"12\" y=\"15\" text-anchor=\"middle\" font-family=\"'Geist','Inter','Arial',sans-serif\" font-weight=\"600\" font-size=\"8\" fill=\"#D52B1E\">72</text>"
        "</svg>";
}

phicore::adapter::v1::AdapterCapabilities capabilities()
{
    namespace v1 = phicore::adapter::v1;

    v1::AdapterCapabilities caps;
    caps.required = v1::AdapterRequirement::UsesRetryInterval;
    caps.flags = v1::AdapterFlag::SupportsProbe
        | v1::AdapterFlag::RequiresPolling;

    caps.factoryActions.push_back(action("probe",
                                         "Test login",
                                         "Signs in with the given credentials",
                                         R"({"placement":"card","kind":"command","requiresAck":true})"));

    caps.instanceActions.push_back(action("refresh",
                                          "Refresh now",
                                          "Fetch every thermostat immediately",
                                          R"({"placement":"card","kind":"command"})"));
    caps.instanceActions.push_back(action("rediscover",
                                          "Search for thermostats",
                                          "Add new thermostats and drop removed ones",
                                          R"({"placement":"card","kind":"command","requiresAck":true})"));
    caps.instanceActions.push_back(action("diagnostics",
                                          "Diagnostics",
                                          "Per-device refresh state and raw portal data",
                                          R"({"placement":"card","kind":"command"})"));

    caps.defaultsJson = R"({"pollIntervalSeconds":60,"refreshTimeoutSeconds":30,"awayTemperatureHeat":61,"awayTemperatureCool":88})";
    return caps;
}

phicore::adapter::v1::JsonText configSchemaJson()
{
    QJsonArray fields = credentialFields();
    const QJsonArray options = optionFields();
    for (const QJsonValue &option : options)
        fields.append(option);

    QJsonObject schema;
    schema.insert(QStringLiteral("factory"),
                  section(QStringLiteral("Honeywell account"),
                          QStringLiteral("Sign in to Total Connect Comfort."),
                          fields));
    schema.insert(QStringLiteral("instance"),
                  section(QStringLiteral("Honeywell account"),
                          QStringLiteral("Credentials and polling options."),
                          fields));

    return QJsonDocument(schema).toJson(QJsonDocument::Compact).toStdString();
}

} // namespace phicore::honeywell::ipc
