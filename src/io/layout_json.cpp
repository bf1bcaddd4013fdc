#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <quay/dock_state.hpp>
#include <quay/logger.hpp>
#include <sstream>
#include <string>

namespace quay
{

// ─── DockItemState factories ────────────────────────────────────────────────

DockItemState DockItemState::tabs(std::vector<DockItemState> children, size_t active_index)
{
    DockItemState s;
    s.kind              = Kind::Tabs;
    s.children          = std::move(children);
    s.info.active_index = active_index;
    return s;
}

DockItemState DockItemState::split(Axis axis, float fraction, DockItemState first, DockItemState second)
{
    DockItemState s;
    s.kind          = Kind::Split;
    s.info.axis     = axis;
    s.info.fraction = fraction;
    s.children.reserve(2);
    s.children.push_back(std::move(first));
    s.children.push_back(std::move(second));
    return s;
}

DockItemState DockItemState::panel(std::string name, std::string panel_state)
{
    DockItemState s;
    s.kind             = Kind::Panel;
    s.panel_name       = std::move(name);
    s.info.panel_state = panel_state.empty() ? std::string("null") : std::move(panel_state);
    return s;
}

// ─── Writer ─────────────────────────────────────────────────────────────────

namespace
{

std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

void write_indent(std::ostringstream& os, int depth)
{
    for (int i = 0; i < depth; ++i)
        os << "  ";
}

void write_item(std::ostringstream& os, const DockItemState& item, int depth)
{
    os << "{\n";
    switch (item.kind)
    {
        case DockItemState::Kind::Tabs:
            write_indent(os, depth + 1);
            os << "\"type\": \"tabs\",\n";
            write_indent(os, depth + 1);
            os << "\"active_index\": " << item.info.active_index << ",\n";
            write_indent(os, depth + 1);
            os << "\"children\": [";
            for (size_t i = 0; i < item.children.size(); ++i)
            {
                os << (i == 0 ? "\n" : ",\n");
                write_indent(os, depth + 2);
                write_item(os, item.children[i], depth + 2);
            }
            if (!item.children.empty())
            {
                os << "\n";
                write_indent(os, depth + 1);
            }
            os << "]\n";
            break;

        case DockItemState::Kind::Split:
        {
            static const DockItemState empty_tabs = DockItemState::tabs({});
            const DockItemState*       first      = item.first() ? item.first() : &empty_tabs;
            const DockItemState*       second     = item.second() ? item.second() : &empty_tabs;
            write_indent(os, depth + 1);
            os << "\"type\": \"split\",\n";
            write_indent(os, depth + 1);
            os << "\"axis\": \"" << axis_name(item.info.axis) << "\",\n";
            write_indent(os, depth + 1);
            os << "\"fraction\": " << item.info.fraction << ",\n";
            write_indent(os, depth + 1);
            os << "\"first\": ";
            write_item(os, *first, depth + 1);
            os << ",\n";
            write_indent(os, depth + 1);
            os << "\"second\": ";
            write_item(os, *second, depth + 1);
            os << "\n";
            break;
        }

        case DockItemState::Kind::Panel:
            write_indent(os, depth + 1);
            os << "\"type\": \"panel\",\n";
            write_indent(os, depth + 1);
            os << "\"panel_name\": \"" << escape_json(item.panel_name) << "\",\n";
            write_indent(os, depth + 1);
            // Panel state is already JSON text.
            os << "\"panel_state\": " << (item.info.panel_state.empty() ? "null" : item.info.panel_state) << "\n";
            break;
    }
    write_indent(os, depth);
    os << "}";
}

void write_dock(std::ostringstream& os, const std::optional<DockState>& dock, int depth)
{
    if (!dock)
    {
        os << "null";
        return;
    }
    os << "{\n";
    write_indent(os, depth + 1);
    os << "\"placement\": \"" << dock_placement_name(dock->placement) << "\",\n";
    write_indent(os, depth + 1);
    os << "\"size\": " << dock->size << ",\n";
    write_indent(os, depth + 1);
    os << "\"open\": " << (dock->open ? "true" : "false") << ",\n";
    write_indent(os, depth + 1);
    os << "\"panel\": ";
    write_item(os, dock->panel, depth + 1);
    os << "\n";
    write_indent(os, depth);
    os << "}";
}

std::ostringstream make_stream()
{
    std::ostringstream os;
    os.precision(std::numeric_limits<float>::max_digits10);
    return os;
}

}   // namespace

std::string serialize_json(const DockItemState& item)
{
    auto os = make_stream();
    write_item(os, item, 0);
    os << "\n";
    return os.str();
}

std::string serialize_json(const DockAreaState& state)
{
    auto os = make_stream();
    os << "{\n";
    os << "  \"version\": ";
    if (state.version)
        os << *state.version;
    else
        os << "null";
    os << ",\n";
    os << "  \"root\": ";
    write_item(os, state.root, 1);
    os << ",\n";
    os << "  \"left_dock\": ";
    write_dock(os, state.left_dock, 1);
    os << ",\n";
    os << "  \"bottom_dock\": ";
    write_dock(os, state.bottom_dock, 1);
    os << ",\n";
    os << "  \"right_dock\": ";
    write_dock(os, state.right_dock, 1);
    os << "\n}\n";
    return os.str();
}

// ─── Reader ─────────────────────────────────────────────────────────────────

namespace
{

// Recursive-descent reader for the layout format. Unknown keys are skipped;
// panel_state values are kept as raw JSON text.
class LayoutReader
{
   public:
    static constexpr int MAX_DEPTH = 128;

    explicit LayoutReader(std::string_view src) : src_(src) {}

    const std::string& error() const { return error_; }

    bool read_area(DockAreaState& out)
    {
        DockAreaState state;
        bool          ok = read_object(
            [&](const std::string& key)
            {
                if (key == "version")
                {
                    if (consume_literal("null"))
                    {
                        state.version.reset();
                        return true;
                    }
                    double v = 0.0;
                    if (!read_number(v))
                        return false;
                    size_t version = 0;
                    if (!to_index(v, "version", version))
                        return false;
                    state.version = version;
                    return true;
                }
                if (key == "root")
                    return read_item(state.root, 0);
                if (key == "left_dock")
                    return read_dock(state.left_dock, DockPlacement::Left);
                if (key == "bottom_dock")
                    return read_dock(state.bottom_dock, DockPlacement::Bottom);
                if (key == "right_dock")
                    return read_dock(state.right_dock, DockPlacement::Right);
                return skip_value(0);
            });
        if (!ok || !at_end())
            return false;
        out = std::move(state);
        return true;
    }

    bool read_root_item(DockItemState& out)
    {
        DockItemState item;
        if (!read_item(item, 0) || !at_end())
            return false;
        out = std::move(item);
        return true;
    }

   private:
    // ─── Layout objects ─────────────────────────────────────────────────

    bool read_item(DockItemState& out, int depth)
    {
        if (depth > MAX_DEPTH)
            return fail("layout nested too deeply");

        std::string                type;
        std::string                panel_name;
        std::string                panel_state = "null";
        std::string                axis;
        double                     fraction     = 0.5;
        double                     active_index = 0.0;
        std::vector<DockItemState> children;
        std::optional<DockItemState> first;
        std::optional<DockItemState> second;

        bool ok = read_object(
            [&](const std::string& key)
            {
                if (key == "type")
                    return read_string(type);
                if (key == "panel_name")
                    return read_string(panel_name);
                if (key == "panel_state")
                    return read_raw(panel_state, depth);
                if (key == "axis")
                    return read_string(axis);
                if (key == "fraction")
                    return read_number(fraction);
                if (key == "active_index")
                    return read_number(active_index);
                if (key == "first")
                    return read_item(first.emplace(), depth + 1);
                if (key == "second")
                    return read_item(second.emplace(), depth + 1);
                if (key == "children")
                {
                    return read_array(
                        [&]
                        {
                            children.emplace_back();
                            return read_item(children.back(), depth + 1);
                        });
                }
                return skip_value(depth);
            });
        if (!ok)
            return false;

        if (type == "tabs")
        {
            size_t active = 0;
            if (!to_index(active_index, "active_index", active))
                return false;
            out = DockItemState::tabs(std::move(children), active);
            return true;
        }
        if (type == "split")
        {
            Axis a;
            if (axis == "horizontal")
                a = Axis::Horizontal;
            else if (axis == "vertical")
                a = Axis::Vertical;
            else
                return fail("unknown split axis '" + axis + "'");
            if (!(fraction >= 0.0 && fraction <= 1.0))
                return fail("split fraction out of range");
            if (!first || !second)
                return fail("split needs both 'first' and 'second'");
            out = DockItemState::split(a, static_cast<float>(fraction), std::move(*first), std::move(*second));
            return true;
        }
        if (type == "panel")
        {
            if (panel_name.empty())
                return fail("panel item without panel_name");
            out = DockItemState::panel(std::move(panel_name), std::move(panel_state));
            return true;
        }
        return fail(type.empty() ? std::string("layout item without type") : "unknown item type '" + type + "'");
    }

    bool read_dock(std::optional<DockState>& out, DockPlacement placement)
    {
        if (consume_literal("null"))
        {
            out.reset();
            return true;
        }

        DockState dock;
        dock.placement = placement;
        double size    = 0.0;
        bool   ok      = read_object(
            [&](const std::string& key)
            {
                if (key == "size")
                    return read_number(size);
                if (key == "open")
                    return read_bool(dock.open);
                if (key == "panel")
                    return read_item(dock.panel, 1);
                // "placement" is implied by the slot the dock is stored in.
                return skip_value(1);
            });
        if (!ok)
            return false;
        dock.size = static_cast<float>(size);
        out       = std::move(dock);
        return true;
    }

    // ─── JSON primitives ────────────────────────────────────────────────

    template <typename OnKey>
    bool read_object(OnKey&& on_key)
    {
        skip_ws();
        if (!consume('{'))
            return fail("expected '{'");
        skip_ws();
        if (consume('}'))
            return true;
        while (true)
        {
            std::string key;
            skip_ws();
            if (!read_string(key))
                return false;
            skip_ws();
            if (!consume(':'))
                return fail("expected ':' after key '" + key + "'");
            skip_ws();
            if (!on_key(key))
                return false;
            skip_ws();
            if (consume(','))
                continue;
            if (consume('}'))
                return true;
            return fail("expected ',' or '}'");
        }
    }

    template <typename OnElement>
    bool read_array(OnElement&& on_element)
    {
        skip_ws();
        if (!consume('['))
            return fail("expected '['");
        skip_ws();
        if (consume(']'))
            return true;
        while (true)
        {
            skip_ws();
            if (!on_element())
                return false;
            skip_ws();
            if (consume(','))
                continue;
            if (consume(']'))
                return true;
            return fail("expected ',' or ']'");
        }
    }

    bool read_string(std::string& out)
    {
        skip_ws();
        if (!consume('"'))
            return fail("expected string");
        out.clear();
        while (pos_ < src_.size())
        {
            char c = src_[pos_++];
            if (c == '"')
                return true;
            if (c != '\\')
            {
                out += c;
                continue;
            }
            if (pos_ >= src_.size())
                break;
            char esc = src_[pos_++];
            switch (esc)
            {
                case '"':
                case '\\':
                case '/':
                    out += esc;
                    break;
                case 'b':
                    out += '\b';
                    break;
                case 'f':
                    out += '\f';
                    break;
                case 'n':
                    out += '\n';
                    break;
                case 'r':
                    out += '\r';
                    break;
                case 't':
                    out += '\t';
                    break;
                case 'u':
                {
                    unsigned cp = 0;
                    if (!read_hex4(cp))
                        return false;
                    if (cp >= 0xDC00 && cp <= 0xDFFF)
                        return fail("unpaired surrogate in \\u escape");
                    if (cp >= 0xD800 && cp <= 0xDBFF)
                    {
                        if (src_.substr(pos_, 2) != "\\u")
                            return fail("unpaired surrogate in \\u escape");
                        pos_ += 2;
                        unsigned low = 0;
                        if (!read_hex4(low))
                            return false;
                        if (low < 0xDC00 || low > 0xDFFF)
                            return fail("unpaired surrogate in \\u escape");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    return fail("bad escape in string");
            }
        }
        return fail("unterminated string");
    }

    // Non-negative whole numbers that fit a size_t.
    bool to_index(double v, const char* what, size_t& out)
    {
        constexpr double limit = static_cast<double>(std::numeric_limits<size_t>::max());
        if (!std::isfinite(v) || v < 0.0 || v >= limit || std::floor(v) != v)
            return fail(std::string(what) + " must be a non-negative integer");
        out = static_cast<size_t>(v);
        return true;
    }

    bool read_hex4(unsigned& out)
    {
        if (pos_ + 4 > src_.size())
            return fail("truncated \\u escape");
        out = 0;
        for (int i = 0; i < 4; ++i)
        {
            char     c = src_[pos_++];
            unsigned d;
            if (c >= '0' && c <= '9')
                d = static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f')
                d = static_cast<unsigned>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F')
                d = static_cast<unsigned>(c - 'A' + 10);
            else
                return fail("bad \\u escape");
            out = (out << 4) | d;
        }
        return true;
    }

    static void append_utf8(std::string& out, unsigned cp)
    {
        if (cp < 0x80)
        {
            out += static_cast<char>(cp);
        }
        else if (cp < 0x800)
        {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x10000)
        {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else
        {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    bool read_number(double& out)
    {
        skip_ws();
        size_t start = pos_;
        while (pos_ < src_.size())
        {
            char c = src_[pos_];
            if ((c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E')
                ++pos_;
            else
                break;
        }
        if (pos_ == start)
            return fail("expected number");

        std::string token(src_.substr(start, pos_ - start));
        char*       end = nullptr;
        out             = std::strtod(token.c_str(), &end);
        if (end != token.c_str() + token.size())
        {
            pos_ = start;
            return fail("malformed number '" + token + "'");
        }
        return true;
    }

    bool read_bool(bool& out)
    {
        skip_ws();
        if (consume_literal("true"))
        {
            out = true;
            return true;
        }
        if (consume_literal("false"))
        {
            out = false;
            return true;
        }
        return fail("expected true or false");
    }

    // Copies one value verbatim.
    bool read_raw(std::string& out, int depth)
    {
        skip_ws();
        size_t start = pos_;
        if (!skip_value(depth))
            return false;
        out.assign(src_.substr(start, pos_ - start));
        return true;
    }

    bool skip_value(int depth)
    {
        if (depth > MAX_DEPTH)
            return fail("value nested too deeply");
        skip_ws();
        if (pos_ >= src_.size())
            return fail("unexpected end of input");

        char c = src_[pos_];
        if (c == '{')
            return read_object([&](const std::string&) { return skip_value(depth + 1); });
        if (c == '[')
            return read_array([&] { return skip_value(depth + 1); });
        if (c == '"')
        {
            std::string ignored;
            return read_string(ignored);
        }
        if (consume_literal("true") || consume_literal("false") || consume_literal("null"))
            return true;
        double ignored = 0.0;
        return read_number(ignored);
    }

    // ─── Cursor ─────────────────────────────────────────────────────────

    void skip_ws()
    {
        while (pos_ < src_.size() &&
               (src_[pos_] == ' ' || src_[pos_] == '\t' || src_[pos_] == '\n' || src_[pos_] == '\r'))
            ++pos_;
    }

    bool consume(char c)
    {
        if (pos_ < src_.size() && src_[pos_] == c)
        {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consume_literal(std::string_view word)
    {
        skip_ws();
        if (src_.substr(pos_, word.size()) != word)
            return false;
        pos_ += word.size();
        return true;
    }

    bool at_end()
    {
        skip_ws();
        if (pos_ != src_.size())
            return fail("trailing characters after layout");
        return true;
    }

    bool fail(std::string message)
    {
        // Keep the innermost message; outer frames only propagate it.
        if (error_.empty())
            error_ = std::move(message) + " at offset " + std::to_string(pos_);
        return false;
    }

    std::string_view src_;
    size_t           pos_ = 0;
    std::string      error_;
};

}   // namespace

bool deserialize_json(std::string_view json, DockAreaState& out, std::string* error)
{
    LayoutReader reader(json);
    if (reader.read_area(out))
        return true;
    QUAY_LOG_DEBUG("dock.state", "layout JSON rejected: {}", reader.error());
    if (error)
        *error = reader.error();
    return false;
}

bool deserialize_json(std::string_view json, DockItemState& out, std::string* error)
{
    LayoutReader reader(json);
    if (reader.read_root_item(out))
        return true;
    QUAY_LOG_DEBUG("dock.state", "layout item JSON rejected: {}", reader.error());
    if (error)
        *error = reader.error();
    return false;
}

}   // namespace quay
