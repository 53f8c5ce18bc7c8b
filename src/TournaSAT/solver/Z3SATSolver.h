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

#ifdef USE_Z3

#include <TournaSAT/base/SATSolverBase.h>
#include <z3++.h>
#include <string>
#include <cstdint>

#ifndef TOURNASAT_Z3SATSOLVER_H
#define TOURNASAT_Z3SATSOLVER_H

namespace TournaSAT {

  /*!
   * \brief Z3SATSolver solves the formula in-process with Z3, every DIMACS variable becomes a Boolean constant
   */
  class Z3SATSolver : public SATSolverBase {

  public:

    Z3SATSolver();

    SolverVerdict solve(const std::string &cnfPath) override;

    std::string getName() override { return "Z3"; }

    void setZ3Threads(uint32_t threads) { this->threads = threads; }
    /*!
     * \brief z3's "timeout" parameter for a budget in seconds, clamped to [1, UINT_MAX] ms
     */
    static unsigned timeoutInMilliseconds(double seconds);

  private:

    uint32_t threads;

  };

}

#endif //TOURNASAT_Z3SATSOLVER_H
#endif //USE_Z3
