#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include <cxx_argp_parser.h>


class tool_argp_parser : public cxx_argp::parser {
public:
	tool_argp_parser(size_t expected_args = 0);
};


void configure_aixlog();

bool int_of_string (const char *s, int &i, int base=0);
bool double_of_string (const char *s, double &d);

enum class input_status {
	error,

	end_of_file,

	success,
};

std::vector<std::string> parse_csv_row(const std::string &row);

input_status parse_next_row(std::istream &is, std::vector<std::string> &row);

// quotes fields containing commas, quotes or whitespace so that
// parse_csv_row() gives back the same values
void write_csv_row(std::ostream &os, const std::vector<std::string> &row);
