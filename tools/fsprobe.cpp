#include <QByteArray>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSettings>
#include <QStringList>

#include <cstdint>
#include <vector>

#include "fs_log.h"
#include "memory/flash_reader.h"
#include "memory/fs_detect.h"
#include "memory/partition_table.h"

namespace {

class QtFsLogger : public FsLogger
{
public:
    explicit QtFsLogger(bool verbose) : m_verbose(verbose) {}

    void log(const std::string &message) override
    {
        if (m_verbose)
            qInfo("%s", message.c_str());
    }

    void warn(const std::string &message) override
    {
        qWarning("%s", message.c_str());
    }

    void error(const std::string &message) override
    {
        qCritical("%s", message.c_str());
    }

private:
    bool m_verbose;
};

struct DetectedRegion
{
    QString name;
    QString subtype;
    uint32_t offset = 0;
    uint32_t size = 0;
    FsType type = FsTypeSpiffs;
};

QSettings::Format settingsFormatForPath(const QString &path)
{
    return path.endsWith(QStringLiteral(".ini"), Qt::CaseInsensitive)
        ? QSettings::IniFormat : QSettings::NativeFormat;
}

// Decimal or 0x-prefixed hex
bool parseNumber(const QString &text, uint32_t *out)
{
    bool ok = false;
    const uint value = text.trimmed().toUInt(&ok, 0);
    if (ok && out)
        *out = value;
    return ok;
}

QString hexString(uint32_t value)
{
    return QStringLiteral("0x%1").arg(QString::number(value, 16).toUpper().rightJustified(8, QLatin1Char('0')));
}

QByteArray formatText(const QList<DetectedRegion> &regions, bool singleRegion)
{
    QByteArray out;
    for (const DetectedRegion &region : regions) {
        if (singleRegion) {
            out += fs_type_name(region.type);
        } else {
            out += region.name.toUtf8();
            out += ' ';
            out += hexString(region.offset).toLatin1();
            out += ' ';
            out += hexString(region.size).toLatin1();
            out += ' ';
            out += region.subtype.toUtf8();
            out += ' ';
            out += fs_type_name(region.type);
        }
        out += '\n';
    }
    return out;
}

QByteArray formatJson(const QString &imagePath, const QList<DetectedRegion> &regions,
                      bool singleRegion, bool pretty)
{
    QJsonArray array;
    for (const DetectedRegion &region : regions) {
        QJsonObject obj;
        if (!singleRegion) {
            obj.insert(QStringLiteral("label"), region.name);
            obj.insert(QStringLiteral("subtype"), region.subtype);
        }
        obj.insert(QStringLiteral("offset"), static_cast<double>(region.offset));
        obj.insert(QStringLiteral("size"), static_cast<double>(region.size));
        obj.insert(QStringLiteral("detected"), QString::fromLatin1(fs_type_name(region.type)));
        array.append(obj);
    }

    QJsonObject root;
    root.insert(QStringLiteral("schema"), QStringLiteral("fsprobe.detect.v1"));
    root.insert(QStringLiteral("image"), imagePath);
    root.insert(QStringLiteral("partitions"), array);

    return QJsonDocument(root).toJson(pretty ? QJsonDocument::Indented : QJsonDocument::Compact);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("fsprobe"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Detect SPIFFS or LittleFS in flash image partitions"));
    parser.addHelpOption();

    QCommandLineOption imageOpt(QStringList() << QStringLiteral("i") << QStringLiteral("image"),
                                QStringLiteral("Path to flash image."),
                                QStringLiteral("path"));
    QCommandLineOption offsetOpt(QStringList() << QStringLiteral("offset"),
                                 QStringLiteral("Detect a single region starting at this offset."),
                                 QStringLiteral("offset"));
    QCommandLineOption sizeOpt(QStringList() << QStringLiteral("size"),
                               QStringLiteral("Size of the region (defaults to rest of the image)."),
                               QStringLiteral("size"));
    QCommandLineOption tableOffsetOpt(QStringList() << QStringLiteral("table-offset"),
                                      QStringLiteral("Partition table offset (default 0x8000)."),
                                      QStringLiteral("offset"));
    QCommandLineOption tableSizeOpt(QStringList() << QStringLiteral("table-size"),
                                    QStringLiteral("Partition table size (default 0x1000)."),
                                    QStringLiteral("size"));
    QCommandLineOption configOpt(QStringList() << QStringLiteral("c") << QStringLiteral("config"),
                                 QStringLiteral("Settings file (ini/native)."),
                                 QStringLiteral("path"));
    QCommandLineOption outputOpt(QStringList() << QStringLiteral("o") << QStringLiteral("output"),
                                 QStringLiteral("Write output to file (defaults to stdout)."),
                                 QStringLiteral("path"));
    QCommandLineOption jsonOpt(QStringList() << QStringLiteral("json"),
                               QStringLiteral("Emit JSON instead of text."));
    QCommandLineOption prettyOpt(QStringList() << QStringLiteral("pretty"),
                                 QStringLiteral("Pretty-print output JSON."));
    QCommandLineOption verboseOpt(QStringList() << QStringLiteral("verbose"),
                                  QStringLiteral("Log every detection step."));

    parser.addOption(imageOpt);
    parser.addOption(offsetOpt);
    parser.addOption(sizeOpt);
    parser.addOption(tableOffsetOpt);
    parser.addOption(tableSizeOpt);
    parser.addOption(configOpt);
    parser.addOption(outputOpt);
    parser.addOption(jsonOpt);
    parser.addOption(prettyOpt);
    parser.addOption(verboseOpt);
    parser.process(app);

    if (!parser.isSet(imageOpt)) {
        parser.showHelp(2);
        return 2;
    }

    QString tableOffsetText = QStringLiteral("0x8000");
    QString tableSizeText = QStringLiteral("0x1000");
    bool pretty = false;
    if (parser.isSet(configOpt)) {
        const QString configPath = parser.value(configOpt);
        if (!QFile::exists(configPath)) {
            qCritical("Config file not found.");
            return 2;
        }
        QSettings settings(configPath, settingsFormatForPath(configPath));
        tableOffsetText = settings.value(QStringLiteral("partitionTable/offset"), tableOffsetText).toString();
        tableSizeText = settings.value(QStringLiteral("partitionTable/size"), tableSizeText).toString();
        pretty = settings.value(QStringLiteral("output/pretty"), false).toBool();
    }
    if (parser.isSet(tableOffsetOpt))
        tableOffsetText = parser.value(tableOffsetOpt);
    if (parser.isSet(tableSizeOpt))
        tableSizeText = parser.value(tableSizeOpt);
    if (parser.isSet(prettyOpt))
        pretty = true;

    uint32_t tableOffset = 0, tableSize = 0;
    if (!parseNumber(tableOffsetText, &tableOffset)) {
        qCritical("Invalid partition table offset.");
        return 2;
    }
    if (!parseNumber(tableSizeText, &tableSize) || tableSize < PARTITION_ENTRY_SIZE) {
        qCritical("Invalid partition table size.");
        return 2;
    }

    uint32_t regionOffset = 0, regionSize = 0;
    const bool singleRegion = parser.isSet(offsetOpt);
    if (singleRegion && !parseNumber(parser.value(offsetOpt), &regionOffset)) {
        qCritical("Invalid --offset value.");
        return 2;
    }
    if (parser.isSet(sizeOpt)) {
        if (!singleRegion) {
            qCritical("--size requires --offset.");
            return 2;
        }
        if (!parseNumber(parser.value(sizeOpt), &regionSize)) {
            qCritical("Invalid --size value.");
            return 2;
        }
    }

    const QString imagePath = parser.value(imageOpt);
    FileFlashReader reader;
    std::string error;
    if (!reader.open(QFile::encodeName(imagePath).constData(), error)) {
        qCritical("Could not open flash image: %s", error.c_str());
        return 1;
    }

    QtFsLogger logger(parser.isSet(verboseOpt));
    QList<DetectedRegion> regions;

    if (singleRegion) {
        if (!parser.isSet(sizeOpt)) {
            const size_t rest = reader.size() > regionOffset ? reader.size() - regionOffset : 0;
            regionSize = rest > UINT32_MAX ? UINT32_MAX : (uint32_t)rest;
        }

        DetectedRegion region;
        region.offset = regionOffset;
        region.size = regionSize;
        region.type = fs_detect(reader, regionOffset, regionSize, &logger);
        regions.append(region);
    } else {
        std::vector<flash_partition_info> parts;
        if (!partition_table_read(reader, tableOffset, tableSize, parts, error)) {
            qCritical("Could not read partition table: %s", error.c_str());
            return 1;
        }
        if (parts.empty()) {
            qCritical("No partition table found at %s.", qPrintable(hexString(tableOffset)));
            return 1;
        }

        for (const flash_partition_info &part : parts) {
            if (!part.is_filesystem())
                continue;

            logger.log("Detecting filesystem type for partition \"" + part.name + "\"...");
            DetectedRegion region;
            region.name = QString::fromStdString(part.name);
            region.subtype = QString::fromStdString(partition_subtype_name(part.type, part.subtype));
            region.offset = part.offset;
            region.size = part.size;
            region.type = fs_detect(reader, part.offset, part.size, &logger);
            regions.append(region);
        }

        if (regions.isEmpty())
            qWarning("Partition table has no SPIFFS or LittleFS partitions.");
    }

    const QByteArray outputBytes = parser.isSet(jsonOpt)
        ? formatJson(imagePath, regions, singleRegion, pretty)
        : formatText(regions, singleRegion);

    if (parser.isSet(outputOpt)) {
        QFile outFile(parser.value(outputOpt));
        if (!outFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            qCritical("Could not write output file.");
            return 1;
        }
        outFile.write(outputBytes);
        outFile.close();
    } else {
        QFile out;
        if (!out.open(stdout, QIODevice::WriteOnly))
            return 1;
        out.write(outputBytes);
        out.close();
    }

    return 0;
}
