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

#include "CaDiCaLTerminator.h"

#ifdef USE_CADICAL
namespace TournaSAT {
	CaDiCaLTerminator::CaDiCaLTerminator(double budgetInSeconds)
		: budget(budgetInSeconds), stoppedSolver(false), start(std::chrono::steady_clock::now()) {}

	bool CaDiCaLTerminator::terminate() {
		if (this->budget <= 0.0) return false;
		if (this->getElapsedTime() < this->budget) return false;
		this->stoppedSolver = true;
		return true;
	}

	void CaDiCaLTerminator::restart(double budgetInSeconds) {
		this->budget = budgetInSeconds;
		this->stoppedSolver = false;
		this->start = std::chrono::steady_clock::now();
	}

	double CaDiCaLTerminator::getElapsedTime() const {
		auto elapsed = std::chrono::steady_clock::now() - this->start;
		return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() / 1000.0;
	}
}
#endif
