#include "chonker.hpp"

#include <QApplication>
#include <QDebug>
#include <argparse/argparse.hpp>

void
init_args(argparse::ArgumentParser &program)
{
    program.add_argument("-p", "--page")
        .help("Page number to go to")
        .scan<'i', int>()
        .default_value(-1)
        .metavar("PAGE_NUMBER");

    program.add_argument("-c", "--config")
        .help("Path to config.toml file")
        .nargs(1)
        .metavar("CONFIG_PATH");

    program.add_argument("-j", "--json")
        .help("Load a pre-extracted items JSON file")
        .nargs(1)
        .metavar("JSON_PATH");

    program.add_argument("-e", "--extract")
        .help("Run the extraction command on the opened PDF")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--about")
        .help("Show about dialog")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("files").remaining().metavar("FILE_PATH(s)");
}

int
main(int argc, char *argv[])
{
    argparse::ArgumentParser program("chonker", APP_VERSION,
                                     argparse::default_arguments::all);
    init_args(program);
    try
    {
        program.parse_args(argc, argv);
    }
    catch (const std::exception &e)
    {
        qWarning() << e.what();
        return 1;
    }

    QGuiApplication::setHighDpiScaleFactorRoundingPolicy(
        Qt::HighDpiScaleFactorRoundingPolicy::PassThrough);
    QApplication app(argc, argv);
    QApplication::setApplicationName("chonker");
    QApplication::setApplicationVersion(APP_VERSION);
    chonker d;
    d.ReadArgsParser(program);
    return app.exec();
}
