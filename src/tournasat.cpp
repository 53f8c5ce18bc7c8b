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

#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <memory>
#include <algorithm>
#include <vector>
#include <TournaSAT/utility/Exception.h>
#include "TournaSAT/utility/Tests.h"
#include "TournaSAT/utility/Utility.h"
#include "TournaSAT/utility/Verifier.h"
#include "TournaSAT/scheduler/TournamentScheduler.h"
#include "TournaSAT/solver/ExternalSATSolver.h"
#include <TournaSAT/utility/writer/ScheduleWriter.h>

#ifdef USE_CADICAL
#include <TournaSAT/solver/CaDiCaLSATSolver.h>
#endif

#ifdef USE_Z3
#include <TournaSAT/solver/Z3SATSolver.h>
#endif

using namespace std;

/**
 * Returns the value as string of a command line argument in syntax --key=value
 * @param argv the command line string
 * @param parameter the name of the parameter
 * @param value as string if parameter string was found
 * @return True if parameter string was found
 */
bool getCmdParameter(char* argv, const char* parameter, char* &value) {
  if(strstr(argv, parameter) == argv) {
    value = argv+strlen(parameter);
    return true;
  } else {
    return false;
  }
}

void print_short_help() {
  std::cout << "usage: tournasat [OPTIONS] <number of teams>" << std::endl;
  std::cout << std::endl;
  std::cout << "General Options:" << std::endl;
  std::cout << "Option                   Meaning" << std::endl;
  std::cout << "--------------------------------------------------------------------------------------------------------------------------------" << std::endl;
  std::cout << "--teams=[int]             Number of teams, even and at least 4 (alternatively given as last argument)" << std::endl;
  std::cout << "--solver=<backend>        SAT solver backend, select one of the following:" << std::endl;
  std::cout << "                            EXTERNAL: DIMACS solver executable started as a separate process (default)" << std::endl;
  std::cout << "                            CADICAL: CaDiCaL library (only if compiled with CaDiCaL)" << std::endl;
  std::cout << "                            Z3: Z3 library (only if compiled with Z3)" << std::endl;
  std::cout << "--timeout=[double]        SAT solver timeout in seconds (default: 300, <= 0 means no timeout)" << std::endl;
  std::cout << "--writecnf=[string]       Optional path to keep the generated DIMACS formula (default: none)" << std::endl;
  std::cout << "--writeschedule=[string]  Optional path to csv file to write the found schedule (default: none)" << std::endl;
  std::cout << "--quiet=[0/1]             Set components quiet for no couts (default: 1)" << std::endl;
  std::cout << "--test=[string]           Run a self test and exit" << std::endl;
  std::cout << std::endl;
  std::cout << "Options for the external SAT solver:" << std::endl;
  std::cout << std::endl;
  std::cout << "--solverpath=[string]     Name or path of the solver executable (default: glucose-syrup)" << std::endl;
  std::cout << "--solverargs=[a,b,...]    Comma separated arguments placed before the formula path (default: -model)" << std::endl;
  std::cout << std::endl;
}

int main(int argc, char *args[]) {
  int teams = -1;
  double timeout = 300.0;
  bool quiet = true;

  enum SolverSelection {EXTERNAL, CADICAL, Z3};
  SolverSelection solverSelection = EXTERNAL;

  std::string solverPath = "glucose-syrup";
  std::vector<std::string> solverArgs = {"-model"};
  std::string cnfFile = "";
  std::string scheduleFile = "";

  if(argc <= 1) {
      print_short_help();
      exit(0);
  }

  try {
    //parse command line
    for (int i = 1; i < argc; i++) {
      char* value;
      if(getCmdParameter(args[i],"--timeout=",value)) {
        timeout = atof(value);
      }
      else if(getCmdParameter(args[i],"--teams=",value)) {
        teams = atoi(value);
      }
      else if(getCmdParameter(args[i],"--solverpath=",value)) {
        solverPath = std::string(value);
      }
      else if(getCmdParameter(args[i],"--solverargs=",value)) {
        solverArgs = TournaSAT::Utility::splitString(std::string(value), ',');
      }
      else if(getCmdParameter(args[i],"--writecnf=",value)) {
        cnfFile = std::string(value);
      }
      else if(getCmdParameter(args[i],"--writeschedule=",value)) {
        scheduleFile = std::string(value);
      }
      else if(getCmdParameter(args[i],"--quiet=",value)) {
        string v = string(value);
        if(v=="0" or TournaSAT::Utility::iequals(v, "false") or TournaSAT::Utility::iequals(v, "zero")) {
          quiet = false;
        }
      }
      else if(getCmdParameter(args[i],"--solver=",value)) {
        std::string valueStr = std::string(value);
        if(TournaSAT::Utility::iequals(valueStr, "external")) {
          solverSelection = EXTERNAL;
        }
        else if(TournaSAT::Utility::iequals(valueStr, "cadical")) {
#ifndef USE_CADICAL
          throw TournaSAT::Exception("CaDiCaL not active! Solver can't be chosen: " + valueStr);
#endif
          solverSelection = CADICAL;
        }
        else if(TournaSAT::Utility::iequals(valueStr, "z3")) {
#ifndef USE_Z3
          throw TournaSAT::Exception("Z3 not active! Solver can't be chosen: " + valueStr);
#endif
          solverSelection = Z3;
        }
        else {
          throw TournaSAT::Exception("Solver " + valueStr + " unknown!");
        }
      }
      //TournaSAT Auto Test Function
      else if(getCmdParameter(args[i],"--test=",value)) {
        string str = std::string(value);
        if(str=="INDEXER" && TournaSAT::Tests::variableIndexerTest()==false) exit(-1);
        if(str=="CARDINALITY" && TournaSAT::Tests::cardinalityEncoderTest()==false) exit(-1);
        if(str=="CONSTRAINTS" && TournaSAT::Tests::constraintBuilderTest()==false) exit(-1);
        if(str=="DIMACS" && TournaSAT::Tests::dimacsTest()==false) exit(-1);
        if(str=="SOLVEROUTPUT" && TournaSAT::Tests::solverOutputReaderTest()==false) exit(-1);
        if(str=="DECODER" && TournaSAT::Tests::resultDecoderTest()==false) exit(-1);
        if(str=="INVALIDINPUT" && TournaSAT::Tests::invalidInputTest()==false) exit(-1);
        if(str=="FACADE" && TournaSAT::Tests::tournamentSchedulerTest()==false) exit(-1);
        if(str=="EXTERNALSOLVER" && TournaSAT::Tests::externalSolverTest()==false) exit(-1);
        if(str=="SCHEDULEWRITER" && TournaSAT::Tests::scheduleWriterTest()==false) exit(-1);
        if(str=="CADICAL" && TournaSAT::Tests::cadicalTest()==false) exit(-1);
        if(str=="Z3" && TournaSAT::Tests::z3Test()==false) exit(-1);
        exit(0);
      }
      else if((args[i][0] != '-') && getCmdParameter(args[i],"",value)) {
        teams = atoi(value);
      } else {
        std::cout << "Error: Illegal Option: " << args[i] << std::endl;
        print_short_help();
        exit(-1);
      }
    }
    //output major settings:
    std::cout << "settings:" << std::endl;
    std::cout << "teams=" << teams << std::endl;
    std::cout << "timeout=" << timeout << std::endl;
    std::cout << "quiet=" << quiet << std::endl;
    std::cout << "solver=";
    switch(solverSelection) {
      case EXTERNAL:
        cout << "EXTERNAL (" << solverPath;
        for(auto &a : solverArgs) cout << " " << a;
        cout << ")";
        break;
      case CADICAL:
        cout << "CADICAL";
        break;
      case Z3:
        cout << "Z3";
        break;
    }
    std::cout << std::endl;

    std::unique_ptr<TournaSAT::SATSolverBase> solver;
    switch(solverSelection) {
      case EXTERNAL:
        solver = std::unique_ptr<TournaSAT::SATSolverBase>(new TournaSAT::ExternalSATSolver(solverPath, solverArgs));
        break;
      case CADICAL:
#ifdef USE_CADICAL
        solver = std::unique_ptr<TournaSAT::SATSolverBase>(new TournaSAT::CaDiCaLSATSolver());
#endif
        break;
      case Z3:
#ifdef USE_Z3
        solver = std::unique_ptr<TournaSAT::SATSolverBase>(new TournaSAT::Z3SATSolver());
#endif
        break;
    }
    if(solver == nullptr) {
      throw TournaSAT::Exception("No SAT solver backend available");
    }
    solver->setSolverTimeout(timeout);
    solver->setQuiet(quiet);

    TournaSAT::TournamentScheduler scheduler(teams, *solver);
    scheduler.setQuiet(quiet);
    if(!cnfFile.empty()) {
      cout << "Writing formula to file " << cnfFile << endl;
      scheduler.setCNFPath(cnfFile);
    }

    cout << "TournaSAT: Performing schedule" << endl;
    scheduler.schedule();
    cout << "TournaSAT: Finished with state " << TournaSAT::TournamentScheduler::stateToString(scheduler.getState())
         << " (" << scheduler.getNumVariables() << " literals, " << scheduler.getNumClauses() << " clauses, "
         << scheduler.getSolvingTime() << " seconds in the SAT solver)" << endl;

    switch(scheduler.getState()) {
      case TournaSAT::TournamentScheduler::SOLVED: {
        if(TournaSAT::verifyTournamentSchedule(scheduler.getSchedule())) {
          cout << "Tournament schedule verified successfully" << endl;
        }
        else {
          cout << ">>> Tournament schedule verification failed! <<<" << endl;
        }
        std::cout << "------------------------------------------------------------------------------------" << endl;
        std::cout << "---------------------------------- Schedule: ---------------------------------------" << endl;
        std::cout << "------------------------------------------------------------------------------------" << endl;
        TournaSAT::Utility::printSchedule(scheduler.getSchedule(), std::cout);
        if(!scheduleFile.empty()) {
          TournaSAT::ScheduleWriter writer(scheduleFile, scheduler.getSchedule());
          writer.setFormulaSize(scheduler.getNumVariables(), scheduler.getNumClauses());
          writer.setSolvingTime(scheduler.getSolvingTime());
          writer.write();
        }
        break;
      }
      case TournaSAT::TournamentScheduler::UNSATISFIABLE:
        cout << "No schedule exists for " << teams << " teams!" << endl;
        break;
      default:
        std::cerr << "Error: " << TournaSAT::TournamentScheduler::failureKindToString(scheduler.getFailureKind())
                  << ": " << scheduler.getFailureMessage() << std::endl;
        exit(-1);
    }
  }
  catch(TournaSAT::Exception &e) {
    std::cerr << "Error: " << e.msg << std::endl;
    exit(-1);
  }
  return 0;
}
