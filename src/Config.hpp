#pragma once

#include "Renderer.hpp"
#include "TokenRewriter.hpp"

#include <QString>
#include <string>
#include <vector>

struct Config
{
    struct rewrite
    {
        std::vector<RewriteStrategy> strategies{RewriteStrategy::SubstituteFont,
                                                RewriteStrategy::Literal};
        std::string substitute_font{"Courier"};
        double fixed_width_ratio{0.6};
        double min_font_size{4.0};
        double space_threshold{-80.0}; // TJ adjustments at or below insert a space
    } rewrite{};

    struct alignment
    {
        double min_confidence{0.5};
    } alignment{};

    struct overlay
    {
        bool enabled{true};
        bool prefer_vector{true};
        float zoom{3.0f};
        double confidence_threshold{0.8};
        bool all_spans{false};
    } overlay{};

    struct validation
    {
        bool enabled{true};
        int max_errors{5};
    } validation{};

    struct output
    {
        bool plan{false};
    } output{};

    RenderOptions renderOptions() const noexcept
    {
        RenderOptions opts;
        opts.rewrite.strategies        = rewrite.strategies;
        opts.rewrite.fixed_width_ratio = rewrite.fixed_width_ratio;
        opts.rewrite.min_font_size     = rewrite.min_font_size;
        opts.rewrite.space_threshold   = rewrite.space_threshold;
        opts.substitute_font           = rewrite.substitute_font;
        opts.min_confidence            = alignment.min_confidence;

        opts.overlay.enabled              = overlay.enabled;
        opts.overlay.prefer_vector        = overlay.prefer_vector;
        opts.overlay.zoom                 = overlay.zoom;
        opts.overlay.confidence_threshold = overlay.confidence_threshold;
        opts.overlay.all_spans            = overlay.all_spans;

        opts.build_plan = output.plan;
        return opts;
    }
};
