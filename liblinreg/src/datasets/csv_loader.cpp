#include "liblinreg/datasets/dataset.hpp"
#include "liblinreg/utils/tracing.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace liblinreg {
namespace datasets {

namespace {

std::vector<std::string> SplitLine(const std::string &line) {
	std::vector<std::string> fields;
	std::istringstream iss(line);
	std::string token;
	while (std::getline(iss, token, ',')) {
		// Trim surrounding whitespace and a trailing '\r' from CRLF files
		const auto first = token.find_first_not_of(" \t\r");
		const auto last = token.find_last_not_of(" \t\r");
		fields.push_back(first == std::string::npos ? "" : token.substr(first, last - first + 1));
	}
	return fields;
}

size_t FindColumn(const std::vector<std::string> &header, const std::string &name, const std::string &filepath) {
	for (size_t i = 0; i < header.size(); i++) {
		if (header[i] == name) {
			return i;
		}
	}
	throw std::invalid_argument("Required column '" + name + "' not found in " + filepath);
}

double ParseNumber(const std::string &token, size_t line_no, const std::string &column) {
	size_t consumed = 0;
	double value = 0.0;
	try {
		value = std::stod(token, &consumed);
	} catch (const std::exception &) {
		consumed = 0;
	}
	// Only finite decimal values; std::stod also accepts nan, inf and hex floats
	const bool hex = token.find_first_of("xX") != std::string::npos;
	if (consumed == 0 || consumed != token.size() || hex || !std::isfinite(value)) {
		throw std::invalid_argument("Malformed number '" + token + "' in column '" + column + "' at line " +
		                            std::to_string(line_no));
	}
	return value;
}

} // namespace

std::vector<Dataset> LoadGroupedCsv(const std::string &filepath) {
	std::ifstream file(filepath);
	if (!file.is_open()) {
		throw std::runtime_error("Failed to open file: " + filepath);
	}

	std::string line;
	if (!std::getline(file, line)) {
		throw std::invalid_argument("Empty CSV file: " + filepath);
	}
	const auto header = SplitLine(line);
	const size_t name_col = FindColumn(header, "dataset", filepath);
	const size_t x_col = FindColumn(header, "x", filepath);
	const size_t y_col = FindColumn(header, "y", filepath);
	const size_t min_fields = std::max(name_col, std::max(x_col, y_col)) + 1;

	std::vector<std::string> order;
	std::map<std::string, std::pair<std::vector<double>, std::vector<double>>> columns;

	size_t line_no = 1;
	while (std::getline(file, line)) {
		line_no++;
		if (line.find_first_not_of(" \t\r") == std::string::npos) {
			continue;
		}
		const auto fields = SplitLine(line);
		if (fields.size() < min_fields) {
			throw std::invalid_argument("Line " + std::to_string(line_no) + " has " + std::to_string(fields.size()) +
			                            " fields, expected at least " + std::to_string(min_fields));
		}

		const std::string &name = fields[name_col];
		auto it = columns.find(name);
		if (it == columns.end()) {
			order.push_back(name);
			it = columns.emplace(name, std::make_pair(std::vector<double>(), std::vector<double>())).first;
		}
		it->second.first.push_back(ParseNumber(fields[x_col], line_no, "x"));
		it->second.second.push_back(ParseNumber(fields[y_col], line_no, "y"));
	}

	std::vector<Dataset> datasets;
	datasets.reserve(order.size());
	for (const auto &name : order) {
		const auto &xy = columns.at(name);
		Dataset dataset;
		dataset.name = name;
		dataset.x = Eigen::Map<const Eigen::VectorXd>(xy.first.data(), static_cast<Eigen::Index>(xy.first.size()));
		dataset.y = Eigen::Map<const Eigen::VectorXd>(xy.second.data(), static_cast<Eigen::Index>(xy.second.size()));
		datasets.push_back(std::move(dataset));
	}

	LINREG_DEBUG("Loaded " << datasets.size() << " datasets from " << filepath);
	return datasets;
}

} // namespace datasets
} // namespace liblinreg
