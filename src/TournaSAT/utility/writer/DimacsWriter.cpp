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

#include "DimacsWriter.h"
#include <TournaSAT/utility/Exception.h>
#include <fstream>

namespace TournaSAT {
	DimacsWriter::DimacsWriter(std::string path, const CnfFormula &formula) : Writer(path), formula(formula) {
	}

	void DimacsWriter::write() {
		if (this->path.empty()) {
			throw Exception("DimacsWriter::write: specify path -> currently empty");
		}
		std::ofstream file(this->path.c_str());
		if (!file.is_open()) {
			throw Exception("DimacsWriter::write: can't open file at location '" + this->path + "'");
		}
		write(this->formula, file);
		file.close();
		if (file.fail()) {
			throw Exception("DimacsWriter::write: failed to write '" + this->path + "'");
		}
	}

	void DimacsWriter::write(const CnfFormula &formula, std::ostream &stream) {
		stream << "p cnf " << formula.numVariables << " " << formula.clauses.size() << "\n";
		for (auto &c : formula.clauses) {
			for (auto &l : c) {
				stream << l << " ";
			}
			stream << "0\n";
		}
	}
}
