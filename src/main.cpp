#include "textsplice.hpp"

#include <QCoreApplication>
#include <QDebug>
#include <argparse/argparse.hpp>

void
init_args(argparse::ArgumentParser &program)
{
    program.add_argument("input")
        .help("PDF file to rewrite")
        .metavar("INPUT_PDF");

    program.add_argument("-m", "--mapping")
        .help("Mapping context JSON file")
        .required()
        .metavar("MAPPING_JSON");

    program.add_argument("-o", "--output")
        .help("Where to write the rewritten PDF")
        .required()
        .metavar("OUTPUT_PDF");

    program.add_argument("-c", "--config")
        .help("Path to config.toml file")
        .nargs(1)
        .metavar("CONFIG_PATH");

    program.add_argument("-r", "--renderer")
        .help("Renderer to use: stream, hybrid, dual or plan")
        .default_value(std::string{"stream"})
        .metavar("RENDERER");

    program.add_argument("--plan")
        .help("Write the span rewrite plan as JSON to this file")
        .nargs(1)
        .metavar("PLAN_JSON");

    program.add_argument("--run-id")
        .help("Run identifier, overrides the one in the mapping context")
        .nargs(1)
        .metavar("RUN_ID");

    program.add_argument("--no-validate")
        .help("Skip checking the rewritten text")
        .default_value(false)
        .implicit_value(true);
}

int
main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("textsplice");
    QCoreApplication::setApplicationVersion(APP_VERSION);

    argparse::ArgumentParser program("textsplice", APP_VERSION,
                                     argparse::default_arguments::all);
    init_args(program);
    try
    {
        program.parse_args(argc, argv);
    }
    catch (const std::exception &e)
    {
        qCritical() << e.what();
        qInfo().noquote() << QString::fromStdString(program.help().str());
        return 1;
    }

    textsplice t;
    return t.Run(program);
}
