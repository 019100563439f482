// Structural equality + debug dump for the document tree.
#include "lmm/ast.hpp"
#include <sstream>
#include <stdexcept>
#include <utility>

namespace lmm {

const char* to_string(Severity s) {
	switch (s) {
	case Severity::Error: return "error";
	case Severity::Warning: return "warning";
	}
	return "unknown";
}

Block::~Block() {
	std::vector<Node> work = std::move(nodes);
	while (!work.empty()) {
		Node n = std::move(work.back());
		work.pop_back();
		if (auto* b = std::get_if<Block>(&n.data)) {
			for (auto& child : b->nodes) work.push_back(std::move(child));
			b->nodes.clear();
		}
	}
}

static bool equal_attrs(const std::vector<Attribute>& a, const std::vector<Attribute>& b, bool ignore_spans) {
	if (a.size() != b.size()) return false;
	for (size_t i = 0; i < a.size(); ++i) {
		if (a[i].key != b[i].key || a[i].value != b[i].value) return false;
		if (!ignore_spans && a[i].span != b[i].span) return false;
	}
	return true;
}

using node_pair = std::pair<const Node*, const Node*>;

bool equal(const Node& a, const Node& b, bool ignore_spans) {
	// Compares one pair of nodes; child pairs are queued instead of recursed into.
	struct Visitor {
		const Node& b; bool ignore_spans; std::vector<node_pair>& work;
		bool operator()(const Block& l) const {
			const auto& r = std::get<Block>(b.data);
			if (l.name != r.name || l.args != r.args) return false;
			if (!ignore_spans && l.span != r.span) return false;
			if (!equal_attrs(l.params, r.params, ignore_spans) || !equal_attrs(l.attrs, r.attrs, ignore_spans)) return false;
			if (l.nodes.size() != r.nodes.size()) return false;
			for (size_t i = 0; i < l.nodes.size(); ++i) work.emplace_back(&l.nodes[i], &r.nodes[i]);
			return true;
		}
		bool operator()(const Text& l) const {
			const auto& r = std::get<Text>(b.data);
			if (l.lines.size() != r.lines.size()) return false;
			for (size_t i = 0; i < l.lines.size(); ++i) {
				const auto& x = l.lines[i]; const auto& y = r.lines[i];
				if (x.indent != y.indent || x.value != y.value || x.is_comment != y.is_comment) return false;
				if (!ignore_spans && x.span != y.span) return false;
			}
			return true;
		}
	};

	std::vector<node_pair> work{{&a, &b}};
	while (!work.empty()) {
		auto [l, r] = work.back();
		work.pop_back();
		if (l->data.index() != r->data.index()) return false;
		if (!std::visit(Visitor{*r, ignore_spans, work}, l->data)) return false;
	}
	return true;
}

bool equal(const Document& a, const Document& b, bool ignore_spans) {
	if (!equal_attrs(a.attrs, b.attrs, ignore_spans) || a.nodes.size() != b.nodes.size()) return false;
	for (size_t i = 0; i < a.nodes.size(); ++i)
		if (!equal(a.nodes[i], b.nodes[i], ignore_spans)) return false;
	return true;
}

std::string to_string(const Span& s) {
	std::ostringstream oss;
	oss << s.start.line << ':' << s.start.col32 << '-' << s.end.line << ':' << s.end.col32;
	return oss.str();
}

namespace {

std::string indent_str(int spaces) { return std::string(static_cast<size_t>(spaces), ' '); }

void dump_attrs(std::ostringstream& os, const char* tag, const std::vector<Attribute>& attrs, int indent) {
	for (const auto& a : attrs)
		os << '\n' << indent_str(indent) << '(' << tag << ' ' << a.key << " \"" << a.value << "\")";
}

// A null node closes the block opened before its children.
struct dump_item { const Node* node; int indent; };

void dump_node(std::ostringstream& os, const Node& root, int indent) {
	std::vector<dump_item> work{{&root, indent}};
	bool first = true;
	while (!work.empty()) {
		dump_item item = work.back();
		work.pop_back();
		if (!item.node) { os << ')'; continue; }
		if (item.node->data.valueless_by_exception()) throw std::invalid_argument("to_string: valueless node");
		if (!first) os << '\n';
		first = false;
		const int ind = item.indent;
		if (const Text* t = as_text(*item.node)) {
			os << indent_str(ind) << "(text";
			for (const auto& l : t->lines)
				os << '\n' << indent_str(ind + 2) << (l.is_comment ? "(comment " : "(line ") << l.indent << " \"" << l.value << "\")";
			os << ')';
			continue;
		}
		const Block& b = std::get<Block>(item.node->data);
		os << indent_str(ind) << "(block " << b.name;
		if (!b.args.empty()) {
			os << " :args [";
			for (size_t i = 0; i < b.args.size(); ++i) { if (i) os << ' '; os << '"' << b.args[i] << '"'; }
			os << ']';
		}
		dump_attrs(os, "param", b.params, ind + 2);
		dump_attrs(os, "attr", b.attrs, ind + 2);
		work.push_back({nullptr, ind});
		for (auto it = b.nodes.rbegin(); it != b.nodes.rend(); ++it) work.push_back({&*it, ind + 2});
	}
}

void dump_nodes(std::ostringstream& os, const std::vector<Node>& nodes, int indent) {
	for (const auto& n : nodes) { os << '\n'; dump_node(os, n, indent); }
}

} // namespace

std::string to_string(const Node& n) {
	std::ostringstream os;
	dump_node(os, n, 0);
	return os.str();
}

std::string to_string(const Document& d) {
	std::ostringstream os;
	os << "(document";
	dump_attrs(os, "attr", d.attrs, 2);
	dump_nodes(os, d.nodes, 2);
	os << ')';
	return os.str();
}

} // namespace lmm
