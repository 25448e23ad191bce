#pragma once

// PDF content stream operators, parsed with MuPDF's lexer and written back
// out as bytes.

#include <optional>
#include <string>
#include <vector>

extern "C"
{
#include <mupdf/fitz.h>
}

struct Operand
{
    enum class Kind
    {
        Null = 0,
        Bool,
        Number,
        String,
        Name,
        Array,
        Dict,
    };

    Kind kind{Kind::Null};
    bool boolean{false};
    double number{0.0};
    // String bytes, or the name without its leading slash
    std::string bytes;
    // Array items, or dictionary key/value pairs laid out flat
    std::vector<Operand> items;

    static Operand makeNumber(double v) noexcept;
    static Operand makeString(std::string b) noexcept;
    static Operand makeName(std::string n) noexcept;
    static Operand makeArray(std::vector<Operand> items) noexcept;

    inline bool isNumber() const noexcept
    {
        return kind == Kind::Number;
    }

    inline bool isString() const noexcept
    {
        return kind == Kind::String;
    }

    inline bool isArray() const noexcept
    {
        return kind == Kind::Array;
    }

    inline bool isName() const noexcept
    {
        return kind == Kind::Name;
    }
};

struct ContentOp
{
    std::vector<Operand> operands;
    std::string op;
    // Raw sample data of an inline image ("BI"), written between ID and EI
    std::string inline_data;

    inline bool isTextShow() const noexcept
    {
        return op == "Tj" || op == "TJ" || op == "'" || op == "\"";
    }
};

namespace ContentStream
{

// Parse `bytes` into operators. Returns std::nullopt (after logging) when
// the lexer reports an error.
std::optional<std::vector<ContentOp>>
parse(fz_context *ctx, const std::string &bytes) noexcept;

std::string
serialize(const std::vector<ContentOp> &ops);

std::string
formatNumber(double v);

std::string
formatString(const std::string &bytes);

} // namespace ContentStream
