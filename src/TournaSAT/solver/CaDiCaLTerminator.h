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

#ifndef TOURNASAT_CADICALTERMINATOR_H
#define TOURNASAT_CADICALTERMINATOR_H

#ifdef USE_CADICAL

#include <cadical.hpp>
#include <chrono>

namespace TournaSAT {
	/*!
	 * \brief CaDiCaL polls terminate() during the search; it returns true once the time budget of the current
	 * solve call is used up and remembers that it stopped the solver
	 */
	class CaDiCaLTerminator : public CaDiCaL::Terminator {
	public:
		explicit CaDiCaLTerminator(double budgetInSeconds);
		bool terminate() override;
		/*!
		 * \brief restart the clock for the next solve call
		 * \param budgetInSeconds <= 0 disables the budget
		 */
		void restart(double budgetInSeconds);
		double getElapsedTime() const;
		bool hasStoppedSolver() const { return this->stoppedSolver; }
	private:
		double budget;
		bool stoppedSolver;
		std::chrono::steady_clock::time_point start;
	};
}

#endif //USE_CADICAL

#endif //TOURNASAT_CADICALTERMINATOR_H
