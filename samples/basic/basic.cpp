// sred - Shift-reduce front-end pipeline for rule-driven parsers in C++
// Copyright (c) 2017-2024 Jesse W. Towner
// See LICENSE.md file for license details

#include "basic_parser.hpp"

#include <cstdlib>
#include <fstream>

// Command line options
struct options
{
	std::string filename{"-"};
	bool trace{false};
};

// Logs every shift and reduction to std::clog
class tracing_reducer : public sred::basic_reducer<basic::token>
{
	basic::basic_grammar const& grammar_;

	void on_reset() override
	{
		std::clog << "reset\n";
	}

	void on_shift(sred::parse_tree<basic::token> const& leaf) override
	{
		std::clog << "shift  " << leaf.token() << " (depth " << depth() << ")\n";
	}

	void on_reduce(sred::rule<basic::token> const& r, sred::parse_tree<basic::token> const& node) override
	{
		std::clog << "reduce " << grammar_.name_of(r.symbol()) << " <- " << node.size() << " element(s) (depth " << depth() << ")\n";
	}

	void on_finish(std::optional<sred::parse_tree<basic::token>> const& result) override
	{
		std::clog << "finish " << (result ? "tree" : "nothing") << ", " << residue().size() << " left over\n";
	}

public:
	explicit tracing_reducer(basic::basic_grammar const& g) : sred::basic_reducer<basic::token>{g.rules, sred::reduction_policy::strict}, grammar_{g} {}
};

// Prints usage information
void print_usage()
{
	std::cout << "Usage: sred-basic [options] [file|-]\n"
	          << "Options:\n"
	          << "  -t, --trace       Log shifts and reductions to stderr\n"
	          << "  -h, --help        Show this help\n"
	          << "If no file is specified, reads from stdin.\n";
}

// Parses command line arguments
options parse_args(int argc, char* argv[])
{
	options opts;
	for (int i = 1; i < argc; ++i) {
		std::string_view const arg{argv[i]};
		if (arg == "-h" || arg == "--help") {
			print_usage();
			std::exit(EXIT_SUCCESS);
		} else if (arg == "-t" || arg == "--trace") {
			opts.trace = true;
		} else if ((arg.size() > 1) && (arg.front() == '-')) {
			throw std::runtime_error("Unknown option: " + std::string{arg});
		} else {
			opts.filename = arg;
		}
	}
	return opts;
}

int main(int argc, char* argv[])
try {
	auto const opts = parse_args(argc, argv);
	std::string const source = [&] {
		if (opts.filename == "-") {
			if (sred::stdin_isatty())
				std::cout << "Enter a BASIC program, end with EOF\n";
			return sred::read_source(std::cin);
		}
		std::ifstream input_file{opts.filename};
		if (!input_file.is_open())
			throw std::runtime_error("Failed to open file: " + opts.filename);
		return sred::read_source(input_file);
	}();

	auto lexer = basic::make_lexer();
	auto const grammar = basic::make_grammar();
	tracing_reducer tracer{grammar};
	sred::basic_reducer<basic::token> quiet{grammar.rules, sred::reduction_policy::strict};
	sred::basic_reducer<basic::token>& reducer = opts.trace ? tracer : quiet;

	int status = 0;
	auto const lines = basic::parse_program(source, lexer, reducer);
	for (std::size_t i = 0; i < lines.size(); ++i) {
		if (!lines[i]) {
			std::cerr << "line " << (i + 1) << ": not a statement\n";
			status = 1;
			continue;
		}
		sred::print_tree<basic::token>(std::cout, *lines[i],
			[](std::ostream& os, basic::token const& t) { os << t; },
			[&grammar](sred::identifier id) { return grammar.name_of(id); });
	}
	return status;
} catch (sred::lex_error const& e) {
	std::cerr << "ERROR: " << e.diagnostic() << "\n";
	return 1;
} catch (std::exception const& e) {
	std::cerr << "ERROR: " << e.what() << "\n";
	return 1;
} catch (...) {
	std::cerr << "UNKNOWN ERROR\n";
	return 1;
}
