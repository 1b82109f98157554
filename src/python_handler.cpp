/**
 * @file python_handler.cpp
 * @brief Python structural analysis driven by a tree-sitter syntax tree.
 *
 * Python is the one language analyzed with a full syntax walk rather than
 * patterns. A file whose tree contains ERROR or MISSING nodes, or Python 2
 * print/exec statements, is treated as unparseable: no components, no
 * dependencies and complexity 0.
 */
#include "language_handler.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <unordered_set>
#include <tree_sitter/api.h>

extern "C" {
    const TSLanguage* tree_sitter_python(void);
}

namespace {

struct ParserDeleter {
    void operator()(TSParser* parser) const { ts_parser_delete(parser); }
};

struct TreeDeleter {
    void operator()(TSTree* tree) const { ts_tree_delete(tree); }
};

using ParserPtr = std::unique_ptr<TSParser, ParserDeleter>;
using TreePtr = std::unique_ptr<TSTree, TreeDeleter>;

std::string nodeType(TSNode node) {
    return ts_node_type(node);
}

// Pre-order walk over named nodes, in source order
template <typename Visitor>
void walkNamed(TSNode root, Visitor&& visit) {
    std::vector<TSNode> stack;
    stack.push_back(root);

    while (!stack.empty()) {
        TSNode node = stack.back();
        stack.pop_back();
        visit(node);

        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = count; i > 0; --i) {
            stack.push_back(ts_node_named_child(node, i - 1));
        }
    }
}

// The grammar still accepts Python 2 statement forms that current Python rejects
bool hasPython2Statements(TSNode root) {
    bool found = false;
    walkNamed(root, [&found](TSNode node) {
        std::string type = nodeType(node);
        if (type == "print_statement" || type == "exec_statement") {
            found = true;
        }
    });
    return found;
}

/**
 * @brief Parse Python source into a syntax tree
 *
 * A fresh parser is created per call, tree-sitter parsers are not safe to
 * share between threads. When the token carries a deadline the parse is
 * bounded by it.
 *
 * @return TreePtr The tree, or nullptr when the source is not valid Python 3
 * @throws AnalysisCancelled if the token fired before the parse finished
 */
TreePtr parsePython(const std::string& content, const CancellationToken& cancel) {
    if (content.size() > std::numeric_limits<uint32_t>::max()) {
        return nullptr;
    }

    cancel.throwIfCancelled();

    ParserPtr parser(ts_parser_new());
    if (!parser || !ts_parser_set_language(parser.get(), tree_sitter_python())) {
        throw std::runtime_error("Failed to initialize tree-sitter Python parser");
    }

    if (auto remaining = cancel.remaining()) {
        ts_parser_set_timeout_micros(parser.get(), static_cast<uint64_t>(std::max<int64_t>(remaining->count(), 1)));
    }

    TreePtr tree(ts_parser_parse_string(parser.get(), nullptr, content.c_str(),
                                        static_cast<uint32_t>(content.size())));
    if (!tree) {
        // A null tree with a timeout set means the parse was abandoned
        cancel.throwIfCancelled();
        return nullptr;
    }

    TSNode root = ts_tree_root_node(tree.get());
    if (ts_node_has_error(root) || hasPython2Statements(root)) {
        return nullptr;
    }

    return tree;
}

std::string nodeText(TSNode node, const std::string& content) {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (end <= start || end > content.size()) {
        return "";
    }
    return content.substr(start, end - start);
}

TSNode fieldChild(TSNode node, const char* field) {
    return ts_node_child_by_field_name(node, field, static_cast<uint32_t>(std::char_traits<char>::length(field)));
}

int lineSpan(TSNode node) {
    return static_cast<int>(ts_node_end_point(node).row - ts_node_start_point(node).row) + 1;
}

bool isSplat(TSNode parameter) {
    std::string type = nodeType(parameter);
    if (type == "list_splat_pattern" || type == "dictionary_splat_pattern" || type == "keyword_separator") {
        return true;
    }
    // "*args: int" is a typed_parameter wrapping the splat
    if (type == "typed_parameter" && ts_node_named_child_count(parameter) > 0) {
        std::string inner = nodeType(ts_node_named_child(parameter, 0));
        return inner == "list_splat_pattern" || inner == "dictionary_splat_pattern";
    }
    return false;
}

// Positional-or-keyword parameters: those after a '/' and before any '*'
int countParameters(TSNode functionNode) {
    TSNode parameters = fieldChild(functionNode, "parameters");
    if (ts_node_is_null(parameters)) {
        return 0;
    }

    int count = 0;
    uint32_t total = ts_node_named_child_count(parameters);
    for (uint32_t i = 0; i < total; ++i) {
        TSNode parameter = ts_node_named_child(parameters, i);
        std::string type = nodeType(parameter);

        if (type == "positional_separator") {
            count = 0;
            continue;
        }
        if (isSplat(parameter)) {
            break;
        }
        if (type == "identifier" || type == "typed_parameter" ||
            type == "default_parameter" || type == "typed_default_parameter") {
            ++count;
        }
    }
    return count;
}

int countMethods(TSNode classNode) {
    TSNode body = fieldChild(classNode, "body");
    if (ts_node_is_null(body)) {
        return 0;
    }

    int methods = 0;
    uint32_t total = ts_node_named_child_count(body);
    for (uint32_t i = 0; i < total; ++i) {
        TSNode child = ts_node_named_child(body, i);
        std::string type = nodeType(child);

        if (type == "decorated_definition") {
            TSNode definition = fieldChild(child, "definition");
            if (!ts_node_is_null(definition) && nodeType(definition) == "function_definition") {
                ++methods;
            }
        } else if (type == "function_definition") {
            ++methods;
        }
    }
    return methods;
}

std::vector<ComponentRecord> componentsFromTree(TSNode root, const std::string& content) {
    std::vector<ComponentRecord> components;

    walkNamed(root, [&](TSNode node) {
        std::string type = nodeType(node);

        if (type == "function_definition") {
            ComponentRecord component(nodeText(fieldChild(node, "name"), content),
                                      ComponentKind::Function, lineSpan(node));
            component.parameterCount = countParameters(node);
            components.push_back(std::move(component));
        } else if (type == "class_definition") {
            ComponentRecord component(nodeText(fieldChild(node, "name"), content),
                                      ComponentKind::Class, lineSpan(node));
            component.methodCount = countMethods(node);
            components.push_back(std::move(component));
        }
    });

    return components;
}

std::vector<std::string> dependenciesFromTree(TSNode root, const std::string& content) {
    std::vector<std::string> dependencies;

    auto add = [&dependencies](const std::string& module) {
        if (!module.empty() && std::find(dependencies.begin(), dependencies.end(), module) == dependencies.end()) {
            dependencies.push_back(module);
        }
    };

    walkNamed(root, [&](TSNode node) {
        std::string type = nodeType(node);

        if (type == "import_statement") {
            // import a.b, c as d
            uint32_t total = ts_node_named_child_count(node);
            for (uint32_t i = 0; i < total; ++i) {
                TSNode child = ts_node_named_child(node, i);
                std::string childType = nodeType(child);
                if (childType == "dotted_name") {
                    add(nodeText(child, content));
                } else if (childType == "aliased_import") {
                    add(nodeText(fieldChild(child, "name"), content));
                }
            }
        } else if (type == "import_from_statement") {
            TSNode module = fieldChild(node, "module_name");
            if (ts_node_is_null(module)) {
                return;
            }
            if (nodeType(module) == "dotted_name") {
                add(nodeText(module, content));
            } else if (nodeType(module) == "relative_import") {
                // "from .pkg import x" depends on pkg; "from . import x" names no module
                uint32_t total = ts_node_named_child_count(module);
                for (uint32_t i = 0; i < total; ++i) {
                    TSNode child = ts_node_named_child(module, i);
                    if (nodeType(child) == "dotted_name") {
                        add(nodeText(child, content));
                    }
                }
            }
        } else if (type == "future_import_statement") {
            add("__future__");
        }
    });

    return dependencies;
}

/**
 * @brief McCabe-style count over the syntax tree
 *
 * Baseline 1, plus one per branch, loop and exception handler. A boolean
 * chain of N operands is N-1 nested boolean_operator nodes, so counting
 * the nodes adds N-1.
 */
double complexityFromTree(TSNode root) {
    static const std::unordered_set<std::string> decisionNodes = {
        "if_statement", "elif_clause", "for_statement", "while_statement",
        "except_clause", "except_group_clause", "boolean_operator"
    };

    double complexity = 1.0;
    walkNamed(root, [&](TSNode node) {
        if (decisionNodes.count(ts_node_type(node)) > 0) {
            complexity += 1.0;
        }
    });
    return complexity;
}

} // namespace

FileAnalysis PythonHandler::analyze(const std::string& content, const std::string& path,
                                   const CancellationToken& cancel) const {
    FileAnalysis result;
    result.handled = true;

    TreePtr tree = parsePython(content, cancel);
    if (!tree) {
        std::cerr << "Warning: Python syntax error in " << path << ", structural facts unavailable" << std::endl;
        result.error = "syntax error";
        return result;
    }

    TSNode root = ts_tree_root_node(tree.get());
    result.components = componentsFromTree(root, content);
    cancel.throwIfCancelled();
    result.dependencies = dependenciesFromTree(root, content);
    cancel.throwIfCancelled();
    result.complexity = complexityFromTree(root);
    return result;
}

std::vector<ComponentRecord> PythonHandler::extractComponents(const std::string& content) const {
    TreePtr tree = parsePython(content, CancellationToken());
    if (!tree) {
        return {};
    }
    return componentsFromTree(ts_tree_root_node(tree.get()), content);
}

std::vector<std::string> PythonHandler::extractDependencies(const std::string& content) const {
    TreePtr tree = parsePython(content, CancellationToken());
    if (!tree) {
        return {};
    }
    return dependenciesFromTree(ts_tree_root_node(tree.get()), content);
}

double PythonHandler::estimateComplexity(const std::string& content) const {
    TreePtr tree = parsePython(content, CancellationToken());
    if (!tree) {
        return 0.0;
    }
    return complexityFromTree(ts_tree_root_node(tree.get()));
}
