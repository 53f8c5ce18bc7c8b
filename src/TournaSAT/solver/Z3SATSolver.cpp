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

#if defined(USE_Z3)

#include "Z3SATSolver.h"
#include <TournaSAT/utility/Exception.h>
#include <TournaSAT/utility/reader/DimacsReader.h>
#include <chrono>
#include <iostream>
#include <limits>
#include <vector>

namespace TournaSAT {

  Z3SATSolver::Z3SATSolver() : SATSolverBase(), threads(1) {
  }

  unsigned Z3SATSolver::timeoutInMilliseconds(double seconds) {
      // at least 1, z3 reads 0 as no limit
      double ms = seconds * 1000.0;
      double maxMs = (double)std::numeric_limits<unsigned>::max();
      if (!(ms >= 1.0)) return 1;
      if (ms >= maxMs) return std::numeric_limits<unsigned>::max();
      return (unsigned)ms;
  }

  SolverVerdict Z3SATSolver::solve(const std::string &cnfPath) {
      this->solvingTime = -1.0;
      auto formula = DimacsReader::read(cnfPath);
      auto start = std::chrono::steady_clock::now();
      try {
          z3::context c;
          z3::solver s(c);
          z3::params p(c);
          if (this->solverTimeout > 0.0) {
              p.set("timeout", timeoutInMilliseconds(this->solverTimeout));
          }
          if (this->threads > 1) {
              p.set("threads", this->threads);
          }
          s.set(p);

          // index 0 is unused
          std::vector<z3::expr> vars;
          vars.push_back(c.bool_val(false));
          for (int v = 1; v <= formula.numVariables; v++) {
              vars.push_back(c.bool_const(("x" + std::to_string(v)).c_str()));
          }
          for (auto &clause : formula.clauses) {
              z3::expr_vector lits(c);
              for (auto &l : clause) {
                  lits.push_back(l > 0 ? vars[l] : !vars[-l]);
              }
              if (lits.empty()) s.add(c.bool_val(false));
              else s.add(z3::mk_or(lits));
          }
          if (!this->quiet) {
              std::cout << std::endl << "Z3SATSolver: checking system of " << s.assertions().size() << " assertions... " << std::endl;
          }

          z3::check_result res = s.check();
          this->solvingTime = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - start).count() / 1000.0;
          if (!this->quiet) {
              std::cout << "Result:" << std::endl;
              std::cout << res << std::endl;
          }
          if (res == z3::unsat) {
              return SolverVerdict::unsatisfiable();
          }
          if (res == z3::unknown) {
              auto reason = s.reason_unknown();
              if (!this->quiet) {
                  std::cout << "Reason Unknown:" << std::endl;
                  std::cout << reason << std::endl;
              }
              if (reason.find("timeout") != std::string::npos or reason.find("canceled") != std::string::npos) {
                  throw SolverTimeoutError("Z3SATSolver: encountered timeout after " + std::to_string(this->solvingTime) +
                    " sec (time budget was " + std::to_string(this->solverTimeout) + " sec)");
              }
              throw SolverInvocationError("Z3SATSolver: result unknown (" + reason + ")");
          }
          z3::model m = s.get_model();
          std::vector<int> assignment;
          for (int v = 1; v <= formula.numVariables; v++) {
              assignment.emplace_back(m.eval(vars[v], true).is_true() ? v : -v);
          }
          return SolverVerdict::satisfiable(assignment);
      }
      catch (z3::exception &e) {
          throw SolverInvocationError("Z3SATSolver: " + std::string(e.msg()));
      }
  }
}
#endif
