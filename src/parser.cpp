// parser.cpp - single-pass LMM scanner producing a Document and diagnostics
#include "lmm/parser.hpp"
#include "lmm/cursor.hpp"
#include "lmm/env.hpp"
#include "lmm/header.hpp"
#include "lmm/text.hpp"

#include <cstdio>
#include <optional>
#include <string>
#include <utility>

namespace lmm
{

size_t ParseResult::error_count() const
{
	size_t n = 0;
	for (const auto& d : diagnostics)
		if (d.severity == Severity::Error) ++n;
	return n;
}

size_t ParseResult::warning_count() const
{
	size_t n = 0;
	for (const auto& d : diagnostics)
		if (d.severity == Severity::Warning) ++n;
	return n;
}

namespace
{
using detail::cursor;

// Text segment of one physical line, bytes [start, end). Indentation is only
// weighted when the segment begins at column 0.
std::optional<TextLine> text_segment(std::string_view line, size_t line_index, size_t start, size_t end, const ParseOptions& options)
{
	if (start >= end || end > line.size())
		return std::nullopt;
	auto seg = line.substr(start, end - start);
	size_t indent = 0, skip = 0;
	if (start == 0)
		indent = detail::weighted_indent(seg, options, skip);
	auto value = detail::trim(seg.substr(skip));
	if (value.empty())
		return std::nullopt;
	size_t value_start = static_cast<size_t>(value.data() - line.data());
	TextLine out;
	out.indent = indent;
	out.span.start = detail::position_in_line(line_index, line, value_start);
	out.span.end = detail::position_in_line(line_index, line, value_start + value.size());
	if (start == 0 && detail::starts_with(value, "!!"))
		out.value = "!" + detail::unescape_text(value.substr(2));
	else
		out.value = detail::unescape_text(value);
	return out;
}

std::optional<TextLine> comment_line(std::string_view line, size_t line_index, const ParseOptions& options)
{
	size_t skip = 0;
	size_t indent = detail::weighted_indent(line, options, skip);
	auto rest = detail::ltrim(line.substr(skip));
	if (rest.empty() || rest[0] != '!')
		return std::nullopt;
	auto value = detail::trim(rest.substr(1));
	if (value.empty())
		return std::nullopt;
	size_t value_start = static_cast<size_t>(value.data() - line.data());
	TextLine out;
	out.indent = indent;
	out.value = detail::unescape_text(value);
	out.span.start = detail::position_in_line(line_index, line, value_start);
	out.span.end = detail::position_in_line(line_index, line, value_start + value.size());
	out.is_comment = true;
	return out;
}

// Line rules used inside $ sections: comments and plain text, nothing else.
std::optional<TextLine> verbatim_line(std::string_view line, size_t line_index, const ParseOptions& options)
{
	if (detail::is_comment_line(line))
		return comment_line(line, line_index, options);
	return text_segment(line, line_index, 0, line.size(), options);
}

std::string close_delimiter(size_t plus_count)
{
	return "}" + std::string(plus_count, '+');
}

class parser
{
public:
	parser(std::string_view input, const ParseOptions& options)
		: cur_(input), options_(options), debug_(env_flag_enabled("LMM_DEBUG_PARSE")) {}

	Document parse_document()
	{
		Document doc;
		doc.attrs = parse_attributes_at_start();
		doc.nodes = parse_body();
		consume_trailing_lines();
		if (!cur_.eof())
		{
			Span span;
			span.start = cur_.pos;
			cursor probe = cur_;
			probe.advance_to(cur_.d.size());
			span.end = probe.pos;
			push_diag(span, Severity::Error, "unexpected trailing content");
		}
		return doc;
	}

	std::vector<Diagnostic> take_diagnostics() { return std::move(diags_); }

private:
	cursor cur_;
	ParseOptions options_;
	std::vector<Diagnostic> diags_;
	bool debug_ = false;
	// Offset from which no '{' exists any more; later header scans fail fast.
	size_t no_brace_from_ = std::string_view::npos;

	void push_diag(Span span, Severity severity, std::string message)
	{
		if (debug_)
			std::fprintf(stderr, "[dbg][parse] %s at %zu:%zu: %s\n", to_string(severity), span.start.line, span.start.col32, message.c_str());
		diags_.push_back(Diagnostic{span, severity, std::move(message)});
	}

	// Line the last diagnostic of an unterminated construct is anchored to.
	size_t last_consumed_line() const
	{
		if (cur_.at_line_start() && cur_.pos.line > 0)
			return cur_.pos.line - 1;
		return cur_.pos.line;
	}

	std::vector<Attribute> parse_attributes_at_start()
	{
		std::vector<Attribute> attrs;
		while (!cur_.eof() && cur_.at_line_start())
		{
			auto line = cur_.line();
			if (detail::is_comment_line(line) || detail::is_blank_line(line))
				break;
			auto attr = parse_attribute_line(line);
			if (!attr)
				break;
			attrs.push_back(std::move(*attr));
			cur_.advance_line();
		}
		return attrs;
	}

	std::optional<Attribute> parse_attribute_line(std::string_view line)
	{
		auto trimmed = detail::ltrim(line);
		if (!detail::starts_with(trimmed, "#") || detail::starts_with(trimmed, "##"))
			return std::nullopt;
		auto body = trimmed.substr(1);
		auto colon = body.find(':');
		Span span = detail::line_span(cur_.pos.line, line);
		if (colon == std::string_view::npos)
		{
			push_diag(span, Severity::Error, "attribute missing ':'");
			return std::nullopt;
		}
		auto key = detail::trim(body.substr(0, colon));
		if (key.empty())
		{
			push_diag(span, Severity::Error, "attribute key is empty");
			return std::nullopt;
		}
		return Attribute{std::string(key), std::string(detail::trim(body.substr(colon + 1))), span};
	}

	// One open body: the document itself or a block awaiting its closer.
	struct frame
	{
		std::optional<std::string> closing;
		Block block; // children accumulate in block.nodes
		std::vector<TextLine> pending;
		bool closed = false;
	};

	void flush_text(frame& f)
	{
		if (f.pending.empty())
			return;
		Text text;
		text.lines = std::move(f.pending);
		f.pending.clear();
		f.block.nodes.push_back(Node{std::move(text)});
	}

	// A header on this line opens a block unless the enclosing closer comes
	// first: "@a { @b { x } }" nests, "@code { @Override }" closes.
	bool header_starts_here(const frame& f) const
	{
		auto rest = cur_.rest_of_line();
		if (!detail::starts_block_header(rest))
			return false;
		if (!f.closing)
			return true;
		auto hit = rest.find(*f.closing);
		if (hit == std::string_view::npos)
			return true;
		auto brace = rest.find('{');
		return brace != std::string_view::npos && brace < hit;
	}

	// Node loop shared by the document body and every block body. Open blocks
	// live on an explicit stack, so nesting depth costs heap, not call stack.
	std::vector<Node> parse_body()
	{
		std::vector<frame> stack(1);
		while (true)
		{
			frame& f = stack.back();
			bool done = cur_.eof();
			while (!done)
			{
				if (header_starts_here(f))
				{
					flush_text(f);
					if (auto opened = open_block())
					{
						stack.push_back(std::move(*opened));
						break;
					}
					done = cur_.eof();
					continue;
				}

				if (f.closing)
				{
					auto rest = cur_.rest_of_line();
					auto hit = rest.find(*f.closing);
					if (hit != std::string_view::npos)
					{
						size_t start = cur_.offset_in_line();
						if (auto seg = text_segment(cur_.line(), cur_.pos.line, start, start + hit, options_))
							f.pending.push_back(std::move(*seg));
						cur_.advance_to(cur_.p + hit + f.closing->size());
						f.closed = true;
						done = true;
						break;
					}
				}

				if (cur_.at_line_start())
				{
					auto line = cur_.line();
					if (detail::is_comment_line(line))
					{
						if (auto c = comment_line(line, cur_.pos.line, options_))
							f.pending.push_back(std::move(*c));
						cur_.advance_line();
						done = cur_.eof();
						continue;
					}
					if (detail::is_blank_line(line))
					{
						cur_.advance_line();
						done = cur_.eof();
						continue;
					}
					if (detail::is_dollar_line(line))
					{
						flush_text(f);
						cur_.advance_line();
						if (auto text = parse_verbatim())
							f.block.nodes.push_back(Node{std::move(*text)});
						done = cur_.eof();
						continue;
					}
				}

				size_t start = cur_.offset_in_line();
				auto line = cur_.line();
				if (auto seg = text_segment(line, cur_.pos.line, start, line.size(), options_))
					f.pending.push_back(std::move(*seg));
				cur_.advance_line();
				done = cur_.eof();
			}
			if (!done)
				continue; // a block was just opened

			flush_text(f);
			if (f.closing && !f.closed)
				push_diag(detail::span_at_line_start(last_consumed_line()), Severity::Error, "missing closing delimiter");
			if (stack.size() == 1)
				return std::move(f.block.nodes);

			Block finished = std::move(f.block);
			stack.pop_back();
			if (debug_)
				std::fprintf(stderr, "[dbg][parse] close block '%s' children=%zu\n", finished.name.c_str(), finished.nodes.size());
			stack.back().block.nodes.push_back(Node{std::move(finished)});
		}
	}

	// Lines after an opening '$' line up to the closing one.
	std::optional<Text> parse_verbatim()
	{
		if (debug_)
			std::fprintf(stderr, "[dbg][parse] verbatim section at line %zu\n", cur_.pos.line);
		Text text;
		bool terminated = false;
		while (!cur_.eof())
		{
			auto line = cur_.line();
			if (detail::is_dollar_line(line))
			{
				cur_.advance_line();
				terminated = true;
				break;
			}
			if (auto l = verbatim_line(line, cur_.pos.line, options_))
				text.lines.push_back(std::move(*l));
			cur_.advance_line();
		}
		if (!terminated)
			push_diag(detail::span_at_line_start(last_consumed_line()), Severity::Error, "unterminated $ block");
		if (text.lines.empty())
			return std::nullopt;
		return text;
	}

	// Cursor sits on the line holding the '@' (possibly after leading
	// whitespace). Consumes the header through '{' plus any leading block
	// attributes and returns the frame for the body.
	std::optional<frame> open_block()
	{
		auto rest = cur_.rest_of_line();
		cur_.advance_to(cur_.p + (rest.size() - detail::ltrim(rest).size()));
		const size_t header_line = cur_.pos.line;
		const auto line = cur_.line();
		const Position start = cur_.pos;

		std::string raw;
		cursor probe = cur_;
		bool found = false;
		if (no_brace_from_ == std::string_view::npos || probe.p < no_brace_from_)
		{
			while (!probe.eof())
			{
				char c = probe.peek();
				if (c == '{')
				{
					probe.advance_char();
					found = true;
					break;
				}
				const size_t before = probe.p;
				probe.advance_char();
				if (c == '\n')
					raw += ' ';
				else
					raw.append(probe.d.substr(before, probe.p - before));
			}
		}
		if (!found)
		{
			if (no_brace_from_ == std::string_view::npos || cur_.p < no_brace_from_)
				no_brace_from_ = cur_.p;
			push_diag(detail::line_span(header_line, line), Severity::Error, "block header missing opening delimiter");
			cur_.advance_line();
			return std::nullopt;
		}

		cur_ = probe;
		const Span header_span{start, cur_.pos};
		// Nothing but whitespace after '{': the body starts on the next line.
		if (detail::is_blank_line(cur_.rest_of_line()))
			cur_.advance_line();

		auto header = parse_block_header(raw);
		if (!header)
		{
			// Content after '{' continues as ordinary sibling content.
			push_diag(header_span, Severity::Error, "missing block name");
			return std::nullopt;
		}
		if (header->missing_space)
			push_diag(header_span, Severity::Warning, "missing space between block name and '{' (write '@" + header->name + " {')");

		if (debug_)
			std::fprintf(stderr, "[dbg][parse] open block '%s' line=%zu args=%zu params=%zu plus=%zu\n", header->name.c_str(), header_line, header->args.size(), header->params.size(), header->plus_count);

		frame f;
		f.closing = close_delimiter(header->plus_count);
		f.block.name = std::move(header->name);
		f.block.args = std::move(header->args);
		for (auto& kv : header->params)
			f.block.params.push_back(Attribute{std::move(kv.first), std::move(kv.second), header_span});
		f.block.span = header_span;
		f.block.attrs = parse_attributes_at_start();
		return f;
	}

	void consume_trailing_lines()
	{
		while (!cur_.eof())
		{
			auto line = cur_.line();
			if (detail::is_comment_line(line) || detail::is_blank_line(line))
			{
				cur_.advance_line();
				continue;
			}
			break;
		}
	}
};

} // namespace

ParseResult parse_document(std::string_view input)
{
	return parse_document(input, ParseOptions{});
}

ParseResult parse_document(std::string_view input, const ParseOptions& options)
{
	parser p(input, options);
	ParseResult r;
	r.document = p.parse_document();
	r.diagnostics = p.take_diagnostics();
	return r;
}

} // namespace lmm
