#include "textsplice.hpp"

#include <QFile>
#include <QTemporaryDir>
#include <gtest/gtest.h>

namespace
{

class ConfigTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
    }

    QString writeConfig(const char *toml)
    {
        const QString path = m_dir.filePath("config.toml");
        QFile file(path);
        EXPECT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
        file.write(toml);
        return path;
    }

    QTemporaryDir m_dir;
};

TEST_F(ConfigTest, Defaults)
{
    textsplice app;
    app.setConfigFilePath(m_dir.filePath("absent.toml"));
    app.initConfig();

    const Config &config = app.config();
    ASSERT_EQ(config.rewrite.strategies.size(), 2u);
    EXPECT_EQ(config.rewrite.strategies[0], RewriteStrategy::SubstituteFont);
    EXPECT_EQ(config.rewrite.substitute_font, "Courier");
    EXPECT_DOUBLE_EQ(config.alignment.min_confidence, 0.5);
    EXPECT_TRUE(config.overlay.enabled);
    EXPECT_TRUE(config.validation.enabled);
    EXPECT_EQ(config.validation.max_errors, 5);
    EXPECT_FALSE(config.output.plan);
}

TEST_F(ConfigTest, ReadsEverySection)
{
    textsplice app;
    app.setConfigFilePath(writeConfig(R"(
[rewrite]
strategies = ["literal", "bogus"]
substitute_font = "Helvetica"
fixed_width_ratio = 0.55
min_font_size = 5.0
space_threshold = -100.0

[alignment]
min_confidence = 0.7

[overlay]
enabled = false
prefer_vector = false
zoom = 2.0
confidence_threshold = 0.9
all_spans = true

[validation]
enabled = false
max_errors = 9

[output]
plan = true
)"));
    app.initConfig();

    const Config &config = app.config();
    ASSERT_EQ(config.rewrite.strategies.size(), 1u);
    EXPECT_EQ(config.rewrite.strategies[0], RewriteStrategy::Literal);
    EXPECT_EQ(config.rewrite.substitute_font, "Helvetica");
    EXPECT_DOUBLE_EQ(config.rewrite.fixed_width_ratio, 0.55);
    EXPECT_DOUBLE_EQ(config.rewrite.min_font_size, 5.0);
    EXPECT_DOUBLE_EQ(config.rewrite.space_threshold, -100.0);
    EXPECT_DOUBLE_EQ(config.alignment.min_confidence, 0.7);
    EXPECT_FALSE(config.overlay.enabled);
    EXPECT_FALSE(config.overlay.prefer_vector);
    EXPECT_FLOAT_EQ(config.overlay.zoom, 2.0f);
    EXPECT_DOUBLE_EQ(config.overlay.confidence_threshold, 0.9);
    EXPECT_TRUE(config.overlay.all_spans);
    EXPECT_FALSE(config.validation.enabled);
    EXPECT_EQ(config.validation.max_errors, 9);
    EXPECT_TRUE(config.output.plan);

    const RenderOptions options = config.renderOptions();
    EXPECT_EQ(options.substitute_font, "Helvetica");
    EXPECT_DOUBLE_EQ(options.min_confidence, 0.7);
    EXPECT_DOUBLE_EQ(options.rewrite.space_threshold, -100.0);
    EXPECT_FALSE(options.overlay.enabled);
    EXPECT_TRUE(options.overlay.all_spans);
    EXPECT_TRUE(options.build_plan);
}

TEST_F(ConfigTest, BrokenFileKeepsDefaults)
{
    textsplice app;
    app.setConfigFilePath(writeConfig("[rewrite\nstrategies = ["));
    app.initConfig();

    EXPECT_EQ(app.config().rewrite.strategies.size(), 2u);
    EXPECT_EQ(app.config().rewrite.substitute_font, "Courier");
}

TEST_F(ConfigTest, WrongTypesAreIgnored)
{
    textsplice app;
    app.setConfigFilePath(writeConfig(R"(
[alignment]
min_confidence = "high"

[validation]
max_errors = 3
)"));
    app.initConfig();

    EXPECT_DOUBLE_EQ(app.config().alignment.min_confidence, 0.5);
    EXPECT_EQ(app.config().validation.max_errors, 3);
}

} // namespace
