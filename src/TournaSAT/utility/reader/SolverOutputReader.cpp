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

#include "SolverOutputReader.h"
#include <TournaSAT/utility/Exception.h>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace TournaSAT {

	SolverOutputReader::SolverOutputReader(int numVariables) : numVariables(numVariables), quiet(true),
		statusFound(false), satisfiable(false), terminated(false) {
		if (numVariables < 0) {
			throw Exception("SolverOutputReader: invalid number of variables " + std::to_string(numVariables));
		}
	}

	SolverVerdict SolverOutputReader::read(const std::string &filepath) {
		std::ifstream f(filepath.c_str());
		if (!f.is_open()) {
			throw ParseError("SolverOutputReader::read: can't open solver output at location '" + filepath + "'");
		}
		return this->read(f);
	}

	bool SolverOutputReader::isStatusToken(const std::string &token) {
		return token == "SAT" or token == "UNSAT" or token == "SATISFIABLE" or token == "UNSATISFIABLE"
			or token == "UNKNOWN" or token == "INDETERMINATE" or token == "INDET";
	}

	void SolverOutputReader::readStatus(const std::string &token, const std::string &line) {
		if (this->statusFound) {
			throw ParseError("SolverOutputReader: second status line '" + line + "'");
		}
		if (token == "SATISFIABLE" or token == "SAT") {
			this->satisfiable = true;
		}
		else if (token == "UNSATISFIABLE" or token == "UNSAT") {
			this->satisfiable = false;
		}
		else if (token == "UNKNOWN" or token == "INDETERMINATE" or token == "INDET") {
			throw SolverInvocationError("SAT solver could not decide the formula (status '" + token + "')");
		}
		else {
			throw ParseError("SolverOutputReader: unknown status '" + line + "'");
		}
		this->statusFound = true;
	}

	void SolverOutputReader::readLiterals(std::istream &tokens, const std::string &line) {
		std::string token;
		while (tokens >> token) {
			if (this->terminated) {
				throw ParseError("SolverOutputReader: values after the terminating 0 in line '" + line + "'");
			}
			int lit;
			try {
				size_t pos;
				lit = std::stoi(token, &pos);
				if (pos != token.size()) throw std::invalid_argument(token);
			}
			catch (std::exception &) {
				throw ParseError("SolverOutputReader: invalid literal '" + token + "' in line '" + line + "'");
			}
			if (lit == 0) {
				this->terminated = true;
				continue;
			}
			auto var = lit > 0 ? lit : -lit;
			if (var > this->numVariables) {
				throw ParseError("SolverOutputReader: literal " + token + " exceeds the " +
					std::to_string(this->numVariables) + " variables of the formula");
			}
			auto value = lit > 0 ? 1 : -1;
			if (this->values[var] == -value) {
				throw ParseError("SolverOutputReader: contradicting values for variable " + std::to_string(var));
			}
			if (this->values[var] == value) continue;
			this->values[var] = value;
			this->assignment.emplace_back(lit);
		}
	}

	SolverVerdict SolverOutputReader::read(std::istream &stream) {
		this->statusFound = false;
		this->satisfiable = false;
		this->terminated = false;
		this->assignment.clear();
		this->values.assign((unsigned int)this->numVariables + 1, 0);
		bool competitionFormat = false;
		bool valuesFound = false;

		std::string linebuffer;
		while (std::getline(stream, linebuffer)) {
			linebuffer.erase(std::remove(linebuffer.begin(), linebuffer.end(), '\r'), linebuffer.end());
			std::stringstream lineStream(linebuffer);
			std::string token;
			if (!(lineStream >> token)) continue;
			if (token == "c") continue;
			if (token == "s") {
				std::string status;
				lineStream >> status;
				this->readStatus(status, linebuffer);
				competitionFormat = true;
				continue;
			}
			if (token == "v") {
				if (!this->statusFound) {
					throw ParseError("SolverOutputReader: values before status line '" + linebuffer + "'");
				}
				valuesFound = true;
				this->readLiterals(lineStream, linebuffer);
				continue;
			}
			if (!this->statusFound and !competitionFormat) {
				// MiniSat result file: status token without marker
				std::string rest;
				if (isStatusToken(token) and !(lineStream >> rest)) {
					this->readStatus(token, linebuffer);
					continue;
				}
			}
			if (this->statusFound and !competitionFormat) {
				valuesFound = true;
				std::stringstream allTokens(linebuffer);
				this->readLiterals(allTokens, linebuffer);
				continue;
			}
			// other solver chatter
			if (!this->quiet) {
				std::cout << "SolverOutputReader: ignoring line '" << linebuffer << "'" << std::endl;
			}
		}

		if (!this->statusFound) {
			throw ParseError("SolverOutputReader: solver output does not contain a status line");
		}
		if (!this->satisfiable) {
			if (valuesFound) {
				throw ParseError("SolverOutputReader: unsatisfiable answer must not contain values");
			}
			return SolverVerdict::unsatisfiable();
		}
		if (!valuesFound) {
			throw ParseError("SolverOutputReader: satisfiable answer without values");
		}
		if (!this->terminated) {
			throw ParseError("SolverOutputReader: model is not terminated by 0 (truncated output?)");
		}
		return SolverVerdict::satisfiable(this->assignment);
	}
}
