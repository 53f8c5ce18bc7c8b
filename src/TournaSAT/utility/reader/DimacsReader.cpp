/*
    This file is part of the TournaSAT project.

    Copyright (C) 2024

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include "DimacsReader.h"
#include <TournaSAT/utility/Exception.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace TournaSAT {

	CnfFormula DimacsReader::read(const std::string &filepath) {
		std::ifstream f(filepath.c_str());
		if (!f.is_open()) {
			throw Exception("DimacsReader::read: can't open file at location '" + filepath + "'");
		}
		return read(f);
	}

	int DimacsReader::readNumVariables(const std::string &filepath) {
		std::ifstream f(filepath.c_str());
		if (!f.is_open()) {
			throw Exception("DimacsReader::readNumVariables: can't open file at location '" + filepath + "'");
		}
		std::string linebuffer;
		while (std::getline(f, linebuffer)) {
			std::stringstream lineStream(linebuffer);
			std::string token;
			if (!(lineStream >> token)) continue;
			if (token[0] == 'c') continue;
			std::string format;
			int numVariables;
			if (token != "p" or !(lineStream >> format >> numVariables) or format != "cnf" or numVariables < 0) {
				throw ParseError("DimacsReader: invalid problem line '" + linebuffer + "'");
			}
			return numVariables;
		}
		throw ParseError("DimacsReader: missing problem line in '" + filepath + "'");
	}

	CnfFormula DimacsReader::read(std::istream &stream) {
		CnfFormula formula;
		bool headerFound = false;
		long long declaredClauses = -1;
		Clause current;
		std::string linebuffer;
		while (std::getline(stream, linebuffer)) {
			linebuffer.erase(std::remove(linebuffer.begin(), linebuffer.end(), '\r'), linebuffer.end());
			std::stringstream lineStream(linebuffer);
			std::string token;
			if (!(lineStream >> token)) continue;
			if (token[0] == 'c') continue;
			if (token == "p") {
				if (headerFound) {
					throw ParseError("DimacsReader: duplicate problem line '" + linebuffer + "'");
				}
				std::string format;
				if (!(lineStream >> format >> formula.numVariables >> declaredClauses) or format != "cnf"
					or formula.numVariables < 0 or declaredClauses < 0) {
					throw ParseError("DimacsReader: invalid problem line '" + linebuffer + "'");
				}
				headerFound = true;
				continue;
			}
			if (!headerFound) {
				throw ParseError("DimacsReader: clause before problem line '" + linebuffer + "'");
			}
			do {
				int lit;
				try {
					size_t pos;
					lit = std::stoi(token, &pos);
					if (pos != token.size()) throw std::invalid_argument(token);
				}
				catch (std::exception &) {
					throw ParseError("DimacsReader: invalid literal '" + token + "'");
				}
				if (lit == 0) {
					formula.clauses.emplace_back(current);
					current.clear();
					continue;
				}
				if (lit > formula.numVariables or -lit > formula.numVariables) {
					throw ParseError("DimacsReader: literal " + token + " exceeds the declared " +
						std::to_string(formula.numVariables) + " variables");
				}
				current.emplace_back(lit);
			} while (lineStream >> token);
		}
		if (!headerFound) {
			throw ParseError("DimacsReader: missing problem line");
		}
		if (!current.empty()) {
			throw ParseError("DimacsReader: last clause is not terminated by 0");
		}
		if ((long long)formula.clauses.size() != declaredClauses) {
			throw ParseError("DimacsReader: problem line declares " + std::to_string(declaredClauses) +
				" clauses but " + std::to_string(formula.clauses.size()) + " were found");
		}
		return formula;
	}
}
