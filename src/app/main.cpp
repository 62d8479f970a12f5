#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QGuiApplication>
#include <QJsonDocument>
#include <QStandardPaths>
#include <QScopedPointer>
#include <QTextStream>

#include <KAboutData>
#include <KLocalizedString>

#include "converter.h"
#include "elementdump.h"
#include "pdfrenderer.h"
#include "stylematch.h"
#include "styletableloader.h"

static int fail(const QString &message)
{
    QTextStream err(stderr);
    err << QCoreApplication::applicationName() << ": " << message << Qt::endl;
    return 1;
}

// Only PDF output lays out text; a dump runs without a display platform
static bool wantsDump(int argc, char *argv[])
{
    for (int i = 1; i < argc; ++i) {
        if (qstrcmp(argv[i], "--dump") == 0)
            return true;
    }
    return false;
}

int main(int argc, char *argv[])
{
    // QTextDocument and QPdfWriter need a GUI application for fonts
    QScopedPointer<QCoreApplication> app(wantsDump(argc, argv)
                                             ? new QCoreApplication(argc, argv)
                                             : new QGuiApplication(argc, argv));

    KLocalizedString::setApplicationDomain("markprint");

    KAboutData aboutData(
        QStringLiteral("markprint"),
        i18n("MarkPrint"),
        QStringLiteral("0.1.0"),
        i18n("Convert Markdown into a styled PDF document"),
        KAboutLicense::GPL_V2,
        i18n("(c) 2025-2026"));
    aboutData.setOrganizationDomain("markprint.org");
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    QCommandLineOption pathOption({QStringLiteral("p"), QStringLiteral("path")},
                                  i18n("Markdown file to convert"), i18n("file"));
    QCommandLineOption stringOption({QStringLiteral("s"), QStringLiteral("string")},
                                    i18n("Markdown text to convert"), i18n("markdown"));
    QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
                                    i18n("PDF file to write (default: output.pdf)"), i18n("file"),
                                    QStringLiteral("output.pdf"));
    QCommandLineOption styleOption(QStringLiteral("style"),
                                   i18n("JSON style table to use"), i18n("file"));
    QCommandLineOption dumpOption(QStringLiteral("dump"),
                                  i18n("Print the styled elements as JSON instead of writing a PDF"));
    parser.addOption(pathOption);
    parser.addOption(stringOption);
    parser.addOption(outputOption);
    parser.addOption(styleOption);
    parser.addOption(dumpOption);
    parser.process(*app);
    aboutData.processCommandLine(&parser);

    // A file path wins over a literal string
    QByteArray markdown;
    if (parser.isSet(pathOption)) {
        const QString path = parser.value(pathOption);
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly))
            return fail(i18n("cannot read %1: %2", path, file.errorString()));
        markdown = file.readAll();
    } else if (parser.isSet(stringOption)) {
        markdown = parser.value(stringOption).toUtf8();
    } else {
        return fail(i18n("no input given; use --path or --string"));
    }

    StyleMatch table;
    StyleTableLoader loader;
    QString stylePath = parser.value(styleOption);
    if (stylePath.isEmpty())
        stylePath = QStandardPaths::locate(QStandardPaths::GenericConfigLocation,
                                           QStringLiteral("markprint/style.json"));
    if (!stylePath.isEmpty() && !loader.loadFromFile(stylePath, &table)) {
        // Built-in defaults stay in force
        QTextStream(stderr) << i18n("warning: style file ignored: %1", loader.errorString())
                            << Qt::endl;
    }

    const Converter converter(table);
    const ConversionResult result = converter.convert(markdown);
    if (!result.ok)
        return fail(result.errorString);

    if (parser.isSet(dumpOption)) {
        QTextStream out(stdout);
        out << QJsonDocument(ElementDump::toJson(result.elements)).toJson(QJsonDocument::Indented);
        return 0;
    }

    PdfRenderer renderer(loader.pageLayout());
    if (!renderer.render(result.elements, parser.value(outputOption)))
        return fail(renderer.errorString());

    return 0;
}
