#include <iostream>

#include "TournaSAT/encoding/VariableIndexer.h"
#include "TournaSAT/encoding/ConstraintBuilder.h"
#include "TournaSAT/scheduler/TournamentScheduler.h"
#include "TournaSAT/solver/ExternalSATSolver.h"
#include "TournaSAT/utility/Utility.h"
#include "TournaSAT/utility/Verifier.h"
#include "TournaSAT/utility/writer/DimacsWriter.h"

using namespace TournaSAT;

int main() {

  /*
   * EXAMPLE: ROUND-ROBIN TOURNAMENT WITH AN EXTERNAL SAT SOLVER
   *
   * Eight teams play a single round robin over 7 weeks. Every week has 4 periods (e.g. 4 fields or 4 kick-off times)
   * and every period hosts one match. Each team may play in the same period at most twice over the whole tournament.
   *
   * Every possible match is a Boolean fact "team a meets team b in week w and period p, with a or b at home".
   * The VariableIndexer numbers these facts densely, starting at 1, so that they can be used as DIMACS variables.
   */
  VariableIndexer indexer(8);
  std::cout << indexer.getNumFacts() << " facts for " << indexer.getNumTeams() << " teams" << std::endl;

  /*
   * The ConstraintBuilder creates the clauses. The period limit uses a sequential counter, which adds auxiliary
   * variables above the fact variables.
   */
  ConstraintBuilder builder(indexer);
  builder.setQuiet(false);
  auto formula = builder.build();

  /*
   * Export the formula in DIMACS format (for debugging purposes or for running a solver by hand).
   */
  DimacsWriter dimacsWriter("example.cnf", formula);
  dimacsWriter.write();

  /*
   * The TournamentScheduler does all of the above internally: it builds the formula, hands it to a solver and turns
   * the model back into a schedule. Here, the solver is any DIMACS solver executable in the PATH that prints its answer
   * in the SAT competition format.
   */
  ExternalSATSolver solver("glucose-syrup", {"-model"});
  solver.setSolverTimeout(60);  // kill the solver after 60 seconds
  solver.setQuiet(true);        // suppress the solver's progress output

  TournamentScheduler scheduler(8, solver);
  scheduler.schedule();

  /*
   * Solver problems are not thrown but recorded in the scheduler's state.
   */
  switch (scheduler.getState()) {
    case TournamentScheduler::SOLVED:
      // Always a good a idea to verify the schedule before proceeding with it...
      if (verifyTournamentSchedule(scheduler.getSchedule())) {
        Utility::printSchedule(scheduler.getSchedule(), std::cout);
      }
      break;
    case TournamentScheduler::UNSATISFIABLE:
      std::cout << "No schedule exists!" << std::endl;
      break;
    default:
      std::cout << "Solving failed (" << TournamentScheduler::failureKindToString(scheduler.getFailureKind()) << "): "
                << scheduler.getFailureMessage() << std::endl;
      return 1;
  }
  return 0;
}
