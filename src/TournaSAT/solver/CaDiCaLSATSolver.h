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

#ifndef TOURNASAT_CADICALSATSOLVER_H
#define TOURNASAT_CADICALSATSOLVER_H

#ifdef USE_CADICAL

#include <TournaSAT/base/SATSolverBase.h>
#include <TournaSAT/solver/CaDiCaLTerminator.h>
#include <cadical.hpp>
#include <memory>

namespace TournaSAT {

	/*!
	 * \brief CaDiCaLSATSolver solves the formula in-process with the CaDiCaL library
	 */
	class CaDiCaLSATSolver : public SATSolverBase {
	public:
		CaDiCaLSATSolver();
		SolverVerdict solve(const std::string &cnfPath) override;
		std::string getName() override { return "CaDiCaL"; }
	private:
		std::unique_ptr<CaDiCaL::Solver> solver;
		CaDiCaLTerminator terminator;
	};
}

#endif //USE_CADICAL
#endif //TOURNASAT_CADICALSATSOLVER_H
