#include "ContentStream.hpp"

#include <QDebug>
#include <cmath>
#include <cstdio>

extern "C"
{
#include <mupdf/pdf.h>
}

namespace
{

struct Token
{
    enum class Type
    {
        Keyword,
        Number,
        String,
        Name,
        True,
        False,
        Null,
        OpenArray,
        CloseArray,
        OpenDict,
        CloseDict,
        InlineData,
    };

    Type type;
    std::string text;
    double number{0.0};
};

inline bool
is_white(unsigned char c) noexcept
{
    return c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '\f'
           || c == '\0';
}

inline bool
is_delim(unsigned char c) noexcept
{
    switch (c)
    {
        case '(':
        case ')':
        case '<':
        case '>':
        case '[':
        case ']':
        case '{':
        case '}':
        case '/':
        case '%': return true;
        default: return false;
    }
}

// End (exclusive) of the inline image data that starts at `from`, i.e. the
// offset of the whitespace preceding the closing EI.
size_t
find_inline_image_end(const std::string &bytes, size_t from) noexcept
{
    for (size_t p = from + 1; p + 1 < bytes.size(); ++p)
    {
        if (bytes[p] != 'E' || bytes[p + 1] != 'I')
            continue;
        if (!is_white(static_cast<unsigned char>(bytes[p - 1])))
            continue;
        if (p + 2 == bytes.size()
            || is_white(static_cast<unsigned char>(bytes[p + 2]))
            || is_delim(static_cast<unsigned char>(bytes[p + 2])))
            return p - 1;
    }
    return std::string::npos;
}

bool
lex_all(fz_context *ctx, const std::string &bytes,
        std::vector<Token> &tokens) noexcept
{
    fz_stream *stm = nullptr;
    pdf_lexbuf lb;
    bool ok = true;

    pdf_lexbuf_init(ctx, &lb, PDF_LEXBUF_LARGE);
    fz_var(stm);

    fz_try(ctx)
    {
        stm = fz_open_memory(
            ctx, reinterpret_cast<const unsigned char *>(bytes.data()),
            bytes.size());

        for (;;)
        {
            const pdf_token tok = pdf_lex(ctx, stm, &lb);
            if (tok == PDF_TOK_EOF)
                break;

            switch (tok)
            {
                case PDF_TOK_INT:
                    tokens.push_back({Token::Type::Number, {},
                                      static_cast<double>(lb.i)});
                    break;
                case PDF_TOK_REAL:
                    tokens.push_back({Token::Type::Number, {},
                                      static_cast<double>(lb.f)});
                    break;
                case PDF_TOK_STRING:
                    tokens.push_back({Token::Type::String,
                                      std::string(lb.scratch, lb.len)});
                    break;
                case PDF_TOK_NAME:
                    tokens.push_back({Token::Type::Name,
                                      std::string(lb.scratch, lb.len)});
                    break;
                case PDF_TOK_TRUE: tokens.push_back({Token::Type::True}); break;
                case PDF_TOK_FALSE:
                    tokens.push_back({Token::Type::False});
                    break;
                case PDF_TOK_NULL: tokens.push_back({Token::Type::Null}); break;
                case PDF_TOK_OPEN_ARRAY:
                    tokens.push_back({Token::Type::OpenArray});
                    break;
                case PDF_TOK_CLOSE_ARRAY:
                    tokens.push_back({Token::Type::CloseArray});
                    break;
                case PDF_TOK_OPEN_DICT:
                    tokens.push_back({Token::Type::OpenDict});
                    break;
                case PDF_TOK_CLOSE_DICT:
                    tokens.push_back({Token::Type::CloseDict});
                    break;
                case PDF_TOK_OPEN_BRACE:
                    tokens.push_back({Token::Type::Keyword, "{"});
                    break;
                case PDF_TOK_CLOSE_BRACE:
                    tokens.push_back({Token::Type::Keyword, "}"});
                    break;
                case PDF_TOK_KEYWORD:
                {
                    tokens.push_back({Token::Type::Keyword,
                                      std::string(lb.scratch, lb.len)});
                    if (tokens.back().text != "ID")
                        break;

                    // One whitespace byte separates ID from the sample data
                    size_t start = static_cast<size_t>(fz_tell(ctx, stm));
                    if (start < bytes.size()
                        && is_white(static_cast<unsigned char>(bytes[start])))
                        ++start;
                    size_t end = find_inline_image_end(bytes, start);
                    if (end == std::string::npos)
                        fz_throw(ctx, FZ_ERROR_SYNTAX,
                                 "unterminated inline image");
                    tokens.push_back({Token::Type::InlineData,
                                      bytes.substr(start, end - start)});
                    // Skip past "EI"
                    fz_seek(ctx, stm, static_cast<int64_t>(end + 3), SEEK_SET);
                    break;
                }
                default:
                    fz_throw(ctx, FZ_ERROR_SYNTAX,
                             "unexpected token in content stream");
            }
        }
    }
    fz_always(ctx)
    {
        fz_drop_stream(ctx, stm);
        pdf_lexbuf_fin(ctx, &lb);
    }
    fz_catch(ctx)
    {
        qWarning() << "Cannot parse content stream: "
                   << fz_caught_message(ctx);
        ok = false;
    }

    return ok;
}

// Parses one operand starting at tokens[i], advancing i past it.
std::optional<Operand>
parse_value(const std::vector<Token> &tokens, size_t &i)
{
    if (i >= tokens.size())
        return std::nullopt;

    const Token &t = tokens[i++];
    Operand o;
    switch (t.type)
    {
        case Token::Type::Number: return Operand::makeNumber(t.number);
        case Token::Type::String: return Operand::makeString(t.text);
        case Token::Type::Name: return Operand::makeName(t.text);
        case Token::Type::True:
        case Token::Type::False:
            o.kind    = Operand::Kind::Bool;
            o.boolean = t.type == Token::Type::True;
            return o;
        case Token::Type::Null: return o;
        case Token::Type::OpenArray:
        case Token::Type::OpenDict:
        {
            const bool is_array = t.type == Token::Type::OpenArray;
            const Token::Type close
                = is_array ? Token::Type::CloseArray : Token::Type::CloseDict;
            o.kind = is_array ? Operand::Kind::Array : Operand::Kind::Dict;
            while (i < tokens.size() && tokens[i].type != close)
            {
                auto item = parse_value(tokens, i);
                if (!item)
                    return std::nullopt;
                o.items.push_back(std::move(*item));
            }
            if (i >= tokens.size())
                return std::nullopt;
            ++i;
            return o;
        }
        default: return std::nullopt;
    }
}

std::string
format_name(const std::string &name)
{
    std::string out = "/";
    for (unsigned char c : name)
    {
        if (c < 33 || c > 126 || c == '#' || is_delim(c))
        {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "#%02X", c);
            out += buf;
        }
        else
            out.push_back(static_cast<char>(c));
    }
    return out;
}

void
write_operand(const Operand &o, std::string &out)
{
    switch (o.kind)
    {
        case Operand::Kind::Null: out += "null"; break;
        case Operand::Kind::Bool: out += o.boolean ? "true" : "false"; break;
        case Operand::Kind::Number:
            out += ContentStream::formatNumber(o.number);
            break;
        case Operand::Kind::String:
            out += ContentStream::formatString(o.bytes);
            break;
        case Operand::Kind::Name: out += format_name(o.bytes); break;
        case Operand::Kind::Array:
        case Operand::Kind::Dict:
        {
            const bool is_array = o.kind == Operand::Kind::Array;
            out += is_array ? "[" : "<<";
            for (size_t i = 0; i < o.items.size(); ++i)
            {
                if (i)
                    out.push_back(' ');
                write_operand(o.items[i], out);
            }
            out += is_array ? "]" : ">>";
            break;
        }
    }
}

} // namespace

Operand
Operand::makeNumber(double v) noexcept
{
    Operand o;
    o.kind   = Kind::Number;
    o.number = v;
    return o;
}

Operand
Operand::makeString(std::string b) noexcept
{
    Operand o;
    o.kind  = Kind::String;
    o.bytes = std::move(b);
    return o;
}

Operand
Operand::makeName(std::string n) noexcept
{
    Operand o;
    o.kind  = Kind::Name;
    o.bytes = std::move(n);
    return o;
}

Operand
Operand::makeArray(std::vector<Operand> items) noexcept
{
    Operand o;
    o.kind  = Kind::Array;
    o.items = std::move(items);
    return o;
}

namespace ContentStream
{

std::optional<std::vector<ContentOp>>
parse(fz_context *ctx, const std::string &bytes) noexcept
{
    std::vector<Token> tokens;
    if (!lex_all(ctx, bytes, tokens))
        return std::nullopt;

    std::vector<ContentOp> ops;
    std::vector<Operand> stack;
    size_t i = 0;
    while (i < tokens.size())
    {
        const Token &t = tokens[i];
        if (t.type != Token::Type::Keyword)
        {
            auto value = parse_value(tokens, i);
            if (!value)
            {
                qWarning() << "Cannot parse content stream: malformed operand";
                return std::nullopt;
            }
            stack.push_back(std::move(*value));
            continue;
        }

        ++i;
        if (t.text == "BI")
        {
            ContentOp op;
            op.op = "BI";
            while (i < tokens.size()
                   && !(tokens[i].type == Token::Type::Keyword
                        && tokens[i].text == "ID"))
            {
                auto value = parse_value(tokens, i);
                if (!value)
                {
                    qWarning() << "Cannot parse content stream: bad inline "
                                  "image dictionary";
                    return std::nullopt;
                }
                op.operands.push_back(std::move(*value));
            }
            if (i + 1 >= tokens.size()
                || tokens[i + 1].type != Token::Type::InlineData)
            {
                qWarning() << "Cannot parse content stream: inline image "
                              "without data";
                return std::nullopt;
            }
            op.inline_data = tokens[i + 1].text;
            i += 2;
            stack.clear();
            ops.push_back(std::move(op));
            continue;
        }

        ContentOp op;
        op.op       = t.text;
        op.operands = std::move(stack);
        stack.clear();
        ops.push_back(std::move(op));
    }

    return ops;
}

std::string
serialize(const std::vector<ContentOp> &ops)
{
    std::string out;
    for (const ContentOp &op : ops)
    {
        if (op.op == "BI")
        {
            out += "BI";
            for (const Operand &o : op.operands)
            {
                out.push_back(' ');
                write_operand(o, out);
            }
            out += " ID ";
            out += op.inline_data;
            out += "\nEI\n";
            continue;
        }

        for (const Operand &o : op.operands)
        {
            write_operand(o, out);
            out.push_back(' ');
        }
        out += op.op;
        out.push_back('\n');
    }
    return out;
}

std::string
formatNumber(double v)
{
    if (std::isnan(v) || std::isinf(v))
        return "0";

    if (std::fabs(v - std::round(v)) < 1e-9 && std::fabs(v) < 1e15)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%lld",
                      static_cast<long long>(std::llround(v)));
        return buf;
    }

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.6f", v);
    std::string s(buf);
    while (!s.empty() && s.back() == '0')
        s.pop_back();
    if (!s.empty() && s.back() == '.')
        s.pop_back();
    if (s == "-0")
        s = "0";
    return s;
}

std::string
formatString(const std::string &bytes)
{
    size_t unprintable = 0;
    for (unsigned char c : bytes)
        if (c < 32 || c > 126)
            ++unprintable;

    // Binary (e.g. two-byte CID) strings read better as hex
    if (!bytes.empty() && unprintable * 2 > bytes.size())
    {
        std::string out = "<";
        char buf[3];
        for (unsigned char c : bytes)
        {
            std::snprintf(buf, sizeof(buf), "%02X", c);
            out += buf;
        }
        out += ">";
        return out;
    }

    std::string out = "(";
    for (unsigned char c : bytes)
    {
        switch (c)
        {
            case '(': out += "\\("; break;
            case ')': out += "\\)"; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 32 || c > 126)
                {
                    char buf[5];
                    std::snprintf(buf, sizeof(buf), "\\%03o", c);
                    out += buf;
                }
                else
                    out.push_back(static_cast<char>(c));
        }
    }
    out += ")";
    return out;
}

} // namespace ContentStream
