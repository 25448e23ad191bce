#include "textsplice.hpp"

#include "MappingContext.hpp"
#include "OutputValidator.hpp"
#include "RenderSession.hpp"
#include "Renderer.hpp"

#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QStandardPaths>
#include <toml++/toml.hpp>

namespace
{

template <typename T>
static inline void
set_if_present(toml::node_view<toml::node> node, T &target)
{
    if (auto v = node.value<T>())
        target = *v;
}

static inline void
set_strategies_if_present(toml::node_view<toml::node> n,
                          std::vector<RewriteStrategy> &dst)
{
    const toml::array *arr = n.as_array();
    if (!arr)
        return;

    std::vector<RewriteStrategy> strategies;
    for (const toml::node &item : *arr)
    {
        auto name = item.value<std::string>();
        if (!name)
            continue;

        if (auto s = rewriteStrategyFromName(*name))
            strategies.push_back(*s);
        else
            qWarning() << "Unknown rewrite strategy" << name->c_str();
    }

    if (!strategies.empty())
        dst = std::move(strategies);
}

} // namespace

textsplice::textsplice() noexcept {}

// Initialize the config related stuff
void
textsplice::initConfig() noexcept
{
    m_config_dir = QDir(
        QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation));

    // If config file path is not set, use the default one
    if (m_config_file_path.isEmpty())
        m_config_file_path = m_config_dir.filePath("config.toml");

    if (!QFile::exists(m_config_file_path))
        return;

    toml::table toml;

    try
    {
        toml = toml::parse_file(m_config_file_path.toStdString());
    }
    catch (std::exception &e)
    {
        qWarning() << "There are one or more error(s) in your config file"
                   << m_config_file_path << ":" << e.what()
                   << "Loading default config.";
        return;
    }

    /* rewrite */
    auto rewrite = toml["rewrite"];
    set_strategies_if_present(rewrite["strategies"], m_config.rewrite.strategies);
    set_if_present(rewrite["substitute_font"], m_config.rewrite.substitute_font);
    set_if_present(rewrite["fixed_width_ratio"],
                   m_config.rewrite.fixed_width_ratio);
    set_if_present(rewrite["min_font_size"], m_config.rewrite.min_font_size);
    set_if_present(rewrite["space_threshold"], m_config.rewrite.space_threshold);

    /* alignment */
    auto alignment = toml["alignment"];
    set_if_present(alignment["min_confidence"],
                   m_config.alignment.min_confidence);

    /* overlay */
    auto overlay = toml["overlay"];
    set_if_present(overlay["enabled"], m_config.overlay.enabled);
    set_if_present(overlay["prefer_vector"], m_config.overlay.prefer_vector);
    set_if_present(overlay["zoom"], m_config.overlay.zoom);
    set_if_present(overlay["confidence_threshold"],
                   m_config.overlay.confidence_threshold);
    set_if_present(overlay["all_spans"], m_config.overlay.all_spans);

    /* validation */
    auto validation = toml["validation"];
    set_if_present(validation["enabled"], m_config.validation.enabled);
    set_if_present(validation["max_errors"], m_config.validation.max_errors);

    /* output */
    auto output = toml["output"];
    set_if_present(output["plan"], m_config.output.plan);
}

bool
textsplice::readFile(const QString &path, std::string &bytes) noexcept
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
    {
        qCritical() << "Cannot open" << path << ":" << file.errorString();
        return false;
    }

    const QByteArray data = file.readAll();
    bytes.assign(data.constData(), static_cast<size_t>(data.size()));
    return true;
}

bool
textsplice::writeFile(const QString &path, const QByteArray &bytes) noexcept
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
    {
        qCritical() << "Cannot write" << path << ":" << file.errorString();
        return false;
    }

    if (file.write(bytes) != bytes.size())
    {
        qCritical() << "Short write to" << path << ":" << file.errorString();
        return false;
    }
    return true;
}

int
textsplice::Run(argparse::ArgumentParser &argparser) noexcept
{
    if (argparser.is_used("config"))
        m_config_file_path
            = QString::fromStdString(argparser.get<std::string>("--config"));

    initConfig();

    const std::string kind_name = argparser.get<std::string>("--renderer");
    const auto kind             = rendererKindFromName(kind_name);
    if (!kind)
    {
        qCritical() << "Unknown renderer" << kind_name.c_str()
                    << "(expected stream, hybrid, dual or plan)";
        return 1;
    }

    const QString input
        = QString::fromStdString(argparser.get<std::string>("input"));
    const QString mapping_path
        = QString::fromStdString(argparser.get<std::string>("--mapping"));
    const QString output_path
        = QString::fromStdString(argparser.get<std::string>("--output"));

    QString plan_path;
    if (argparser.is_used("plan"))
        plan_path = QString::fromStdString(argparser.get<std::string>("--plan"));

    const bool validate = m_config.validation.enabled
                          && !argparser.get<bool>("--no-validate")
                          && *kind != RendererKind::PlanOnly
                          && *kind != RendererKind::DualLayer;

    std::string pdf_bytes;
    if (!readFile(input, pdf_bytes))
        return 1;

    RenderSession session;
    RenderResult result;

    try
    {
        MappingContext context = MappingContext::fromFile(mapping_path);
        if (argparser.is_used("run-id"))
            context.setRunId(
                QString::fromStdString(argparser.get<std::string>("--run-id")));

        RenderOptions options = m_config.renderOptions();
        options.build_plan    = options.build_plan || !plan_path.isEmpty();

        auto renderer = makeRenderer(*kind, options);
        result        = renderer->render(session, pdf_bytes, context);
    }
    catch (const MappingError &e)
    {
        qCritical() << "Invalid mapping context:" << e.what();
        return 1;
    }
    catch (const RenderError &e)
    {
        qCritical() << "Render failed:" << e.what();
        return 1;
    }

    if (!writeFile(output_path,
                   QByteArray(result.bytes.data(),
                              static_cast<qsizetype>(result.bytes.size()))))
        return 1;

    if (result.plan)
    {
        const QByteArray json = result.plan->toJson().toJson(QJsonDocument::Indented);
        if (!plan_path.isEmpty())
        {
            if (!writeFile(plan_path, json))
                return 1;
        }
        else
            qInfo().noquote() << json;
    }

    qInfo().noquote()
        << QJsonDocument(result.stats.toJson()).toJson(QJsonDocument::Compact);

    if (!validate)
        return 0;

    Document rewritten(session.context());
    if (!rewritten.openFromBytes(result.rewritten_bytes))
    {
        qCritical() << "Cannot reopen the rewritten document for validation";
        return 1;
    }

    try
    {
        OutputValidator(m_config.validation.max_errors)
            .validate(rewritten, result.entries);
    }
    catch (const ValidationError &e)
    {
        qCritical() << "Validation failed:" << e.what();
        return 2;
    }

    qInfo() << "Validation passed for" << result.entries.size() << "entries";
    return 0;
}
