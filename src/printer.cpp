// ═══════════════════════════════════════════════════════════════════
//  src/printer.cpp — Pretty printer for executable documents
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/printer.h"
#include "gqlpp/lexer.h"

#include <cstdio>
#include <sstream>

namespace gqlpp {

namespace {

class Printer {
public:
    std::string str() const { return out_.str(); }

    void document(const ast::Document& doc) {
        bool first = true;
        for (auto& op : doc.operations) {
            if (!first) out_ << "\n\n";
            first = false;
            operation(op);
        }
        for (auto& fragment : doc.fragments) {
            if (!first) out_ << "\n\n";
            first = false;
            fragmentDefinition(fragment);
        }
        out_ << "\n";
    }

    void value(const ast::Value& v) {
        switch (v.kind) {
            case ast::Value::Kind::Variable: out_ << "$" << v.text; break;
            case ast::Value::Kind::Int:
            case ast::Value::Kind::Float:
            case ast::Value::Kind::Enum:     out_ << v.text; break;
            case ast::Value::Kind::String:
                out_ << (v.block ? printBlockString(v.text) : printString(v.text));
                break;
            case ast::Value::Kind::Boolean:  out_ << (v.boolean ? "true" : "false"); break;
            case ast::Value::Kind::Null:     out_ << "null"; break;
            case ast::Value::Kind::List: {
                out_ << "[";
                for (std::size_t i = 0; i < v.list.size(); ++i) {
                    if (i > 0) out_ << ", ";
                    value(v.list[i]);
                }
                out_ << "]";
                break;
            }
            case ast::Value::Kind::Object: {
                out_ << "{";
                for (std::size_t i = 0; i < v.fields.size(); ++i) {
                    out_ << (i > 0 ? ", " : "") << v.fields[i].name << ": ";
                    value(v.fields[i].value);
                }
                out_ << "}";
                break;
            }
        }
    }

    void selectionSet(const ast::SelectionSet& set) {
        out_ << "{\n";
        ++depth_;
        for (auto& selection : set.selections) {
            indent();
            if (auto* f = selection.field()) {
                field(*f);
            } else if (auto* spread = selection.fragmentSpread()) {
                out_ << "..." << spread->name;
                directives(spread->directives);
            } else if (auto* inl = selection.inlineFragment()) {
                out_ << "...";
                if (!inl->typeCondition.empty()) out_ << " on " << inl->typeCondition;
                directives(inl->directives);
                out_ << " ";
                selectionSet(inl->selectionSet);
            }
            out_ << "\n";
        }
        --depth_;
        indent();
        out_ << "}";
    }

private:
    std::ostringstream out_;
    int depth_ = 0;

    void indent() {
        for (int i = 0; i < depth_; ++i) out_ << "  ";
    }

    void operation(const ast::OperationDefinition& op) {
        bool shorthand = op.operation == ast::OperationType::Query && op.name.empty() &&
                         op.variables.empty() && op.directives.empty();
        if (!shorthand) {
            out_ << ast::toString(op.operation);
            if (!op.name.empty()) out_ << " " << op.name;
            if (!op.variables.empty()) {
                out_ << "(";
                for (std::size_t i = 0; i < op.variables.size(); ++i) {
                    auto& var = op.variables[i];
                    out_ << (i > 0 ? ", " : "") << "$" << var.name << ": " << var.type.toString();
                    if (var.defaultValue) {
                        out_ << " = ";
                        value(*var.defaultValue);
                    }
                    directives(var.directives);
                }
                out_ << ")";
            }
            directives(op.directives);
            out_ << " ";
        }
        selectionSet(op.selectionSet);
    }

    void fragmentDefinition(const ast::FragmentDefinition& fragment) {
        out_ << "fragment " << fragment.name << " on " << fragment.typeCondition;
        directives(fragment.directives);
        out_ << " ";
        selectionSet(fragment.selectionSet);
    }

    void field(const ast::Field& f) {
        if (!f.alias.empty()) out_ << f.alias << ": ";
        out_ << f.name;
        arguments(f.arguments);
        directives(f.directives);
        if (!f.selectionSet.empty()) {
            out_ << " ";
            selectionSet(f.selectionSet);
        }
    }

    void arguments(const std::vector<ast::Argument>& args) {
        if (args.empty()) return;
        out_ << "(";
        for (std::size_t i = 0; i < args.size(); ++i) {
            out_ << (i > 0 ? ", " : "") << args[i].name << ": ";
            value(args[i].value);
        }
        out_ << ")";
    }

    void directives(const std::vector<ast::Directive>& dirs) {
        for (auto& d : dirs) {
            out_ << " @" << d.name;
            arguments(d.arguments);
        }
    }
};

} // namespace

std::string printString(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += "\"";
    return out;
}

std::string printBlockString(const std::string& value) {
    std::string raw = value.find('\n') == std::string::npos ? value : "\n" + value + "\n";
    bool closesEarly = raw == value && !value.empty() && (value.back() == '"' || value.back() == '\\');
    if (closesEarly || value.find('\r') != std::string::npos || blockStringValue(raw) != value) {
        return printString(value);
    }

    std::string out = "\"\"\"";
    for (std::size_t pos = 0; pos < raw.size(); ++pos) {
        if (raw.compare(pos, 3, "\"\"\"") == 0) {
            out += "\\\"\"\"";
            pos += 2;
        } else {
            out += raw[pos];
        }
    }
    out += "\"\"\"";
    return out;
}

std::string print(const ast::Document& document) {
    Printer printer;
    printer.document(document);
    return printer.str();
}

std::string print(const ast::Value& value) {
    Printer printer;
    printer.value(value);
    return printer.str();
}

std::string print(const ast::SelectionSet& selectionSet) {
    Printer printer;
    printer.selectionSet(selectionSet);
    return printer.str();
}

} // namespace gqlpp
