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

#include "TournaSAT/utility/Tests.h"
#include "TournaSAT/encoding/VariableIndexer.h"
#include "TournaSAT/encoding/CardinalityEncoder.h"
#include "TournaSAT/encoding/ConstraintBuilder.h"
#include "TournaSAT/encoding/ResultDecoder.h"
#include "TournaSAT/scheduler/TournamentScheduler.h"
#include "TournaSAT/solver/ExternalSATSolver.h"
#include "TournaSAT/utility/Exception.h"
#include "TournaSAT/utility/TemporaryFile.h"
#include "TournaSAT/utility/Utility.h"
#include "TournaSAT/utility/Verifier.h"
#include "TournaSAT/utility/reader/DimacsReader.h"
#include "TournaSAT/utility/reader/SolverOutputReader.h"
#include "TournaSAT/utility/writer/DimacsWriter.h"
#include "TournaSAT/utility/writer/ScheduleWriter.h"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <thread>
#include <vector>

#ifdef USE_CADICAL
#include "TournaSAT/solver/CaDiCaLSATSolver.h"
#endif
#ifdef USE_Z3
#include "TournaSAT/solver/Z3SATSolver.h"
#endif

namespace TournaSAT {

	namespace {
		// valid tournament for 6 teams: week x period -> {home, away}
		const int referenceSchedule[5][3][2] = {
			{{6, 1}, {2, 5}, {3, 4}},
			{{6, 2}, {3, 1}, {4, 5}},
			{{4, 2}, {5, 1}, {6, 3}},
			{{5, 3}, {6, 4}, {1, 2}},
			{{1, 4}, {2, 3}, {6, 5}}
		};

		Fact makeFact(int home, int away, int week, int period) {
			if (home < away) return Fact(home, away, week, period, HOME);
			return Fact(away, home, week, period, AWAY);
		}

		std::vector<Fact> referenceFacts() {
			std::vector<Fact> facts;
			for (int w = 0; w < 5; w++) {
				for (int p = 0; p < 3; p++) {
					facts.emplace_back(makeFact(referenceSchedule[w][p][0], referenceSchedule[w][p][1], w + 1, p + 1));
				}
			}
			return facts;
		}

		// same matches, but (6,3) moves to period 1 in week 3 -> team 6 plays three times in period 1
		std::vector<Fact> periodViolatingFacts() {
			auto facts = referenceFacts();
			for (auto &f : facts) {
				if (f.week != 3) continue;
				if (f.period == 1) f.period = 3;
				else if (f.period == 3) f.period = 1;
			}
			return facts;
		}

		std::vector<int> modelForFacts(const VariableIndexer &indexer, const std::vector<Fact> &facts) {
			std::vector<bool> values((unsigned int)indexer.getNumFacts() + 1, false);
			for (auto &f : facts) values[indexer.getVariable(f)] = true;
			std::vector<int> model;
			for (int v = 1; v <= indexer.getNumFacts(); v++) {
				model.emplace_back(values[v] ? v : -v);
			}
			return model;
		}

		/*
		 * checks whether the formula is satisfied when the fact variables are fixed by the given facts
		 * every clause with a positive counter literal is a Horn clause, so the counters are derived by forward chaining
		 * starting from all false; a clause that is still violated without a positive counter literal means the
		 * facts can't be extended to a model
		 */
		bool satisfiedWithDerivedCounters(const CnfFormula &formula, const VariableIndexer &indexer,
			const std::vector<Fact> &facts) {
			std::vector<bool> values((unsigned int)formula.numVariables + 1, false);
			for (auto &f : facts) values[indexer.getVariable(f)] = true;
			bool changed = true;
			while (changed) {
				changed = false;
				for (auto &c : formula.clauses) {
					bool sat = false;
					int counterLiteral = 0;
					for (auto &l : c) {
						auto v = l > 0 ? l : -l;
						if ((l > 0) == values[v]) {
							sat = true;
							break;
						}
						if (l > 0 and v > indexer.getNumFacts()) counterLiteral = v;
					}
					if (sat) continue;
					if (counterLiteral == 0) return false;
					values[counterLiteral] = true;
					changed = true;
				}
			}
			return true;
		}

		std::string readFile(const std::string &path) {
			std::ifstream f(path.c_str());
			std::stringstream s;
			s << f.rdbuf();
			return s.str();
		}

		bool fileExists(const std::string &path) {
			std::ifstream f(path.c_str());
			return f.good();
		}

		SolverVerdict parseAnswer(const std::string &answer, int numVariables) {
			std::stringstream s(answer);
			SolverOutputReader reader(numVariables);
			return reader.read(s);
		}

		/*
		 * backend that answers without searching: replays a fixed verdict or throws a fixed error
		 */
		class ScriptedSolver : public SATSolverBase {
		public:
			enum Mode {
				REFERENCE_MODEL,
				PERIOD_VIOLATING_MODEL,
				UNSAT,
				PARSE_FAILURE,
				TIMEOUT,
				INVOCATION_FAILURE,
				MISSING_FILE
			};

			explicit ScriptedSolver(Mode mode) : SATSolverBase(), mode(mode), calls(0), numVariables(-1), numClauses(-1) {}

			SolverVerdict solve(const std::string &cnfPath) override {
				this->calls++;
				this->lastPath = cnfPath;
				auto formula = DimacsReader::read(cnfPath);
				this->numVariables = formula.numVariables;
				this->numClauses = (int)formula.clauses.size();
				this->solvingTime = 0.0;
				switch (this->mode) {
					case REFERENCE_MODEL: {
						VariableIndexer indexer(6);
						return SolverVerdict::satisfiable(modelForFacts(indexer, referenceFacts()));
					}
					case PERIOD_VIOLATING_MODEL: {
						VariableIndexer indexer(6);
						return SolverVerdict::satisfiable(modelForFacts(indexer, periodViolatingFacts()));
					}
					case UNSAT:
						return SolverVerdict::unsatisfiable();
					case PARSE_FAILURE:
						throw ParseError("scripted parse error");
					case TIMEOUT:
						throw SolverTimeoutError("scripted timeout");
					case INVOCATION_FAILURE:
						throw SolverInvocationError("scripted invocation error");
					case MISSING_FILE:
						// plain TournaSAT::Exception
						DimacsReader::read(cnfPath + ".missing");
						return SolverVerdict::unsatisfiable();
				}
				throw Exception("ScriptedSolver: unknown mode");
			}

			std::string getName() override { return "Scripted"; }

			Mode mode;
			int calls;
			std::string lastPath;
			int numVariables;
			int numClauses;
		};

		bool solveFourAndSixTeams(SATSolverBase &solver) {
			solver.setSolverTimeout(300);
			TournamentScheduler four(4, solver);
			four.schedule();
			if (four.getState() != TournamentScheduler::UNSATISFIABLE) {
				std::cout << "Expected 4 teams to be infeasible but got state " <<
					TournamentScheduler::stateToString(four.getState()) << " " << four.getFailureMessage() << std::endl;
				return false;
			}
			TournamentScheduler six(6, solver);
			six.schedule();
			if (six.getState() != TournamentScheduler::SOLVED) {
				std::cout << "Expected a schedule for 6 teams but got state " <<
					TournamentScheduler::stateToString(six.getState()) << " " << six.getFailureMessage() << std::endl;
				return false;
			}
			Utility::printSchedule(six.getSchedule(), std::cout);
			if (!verifyTournamentSchedule(six.getSchedule())) {
				std::cout << "Invalid schedule" << std::endl;
				return false;
			}
			return true;
		}
	}

	bool Tests::variableIndexerTest() {
		for (int n = 4; n <= 12; n += 2) {
			VariableIndexer indexer(n);
			auto W = n - 1;
			auto P = n / 2;
			auto expectedFacts = (n * (n - 1) / 2) * W * P * 2;
			if (indexer.getNumFacts() != expectedFacts) {
				std::cout << "n=" << n << ": expected " << expectedFacts << " facts but got " << indexer.getNumFacts() << std::endl;
				return false;
			}
			std::vector<bool> used((unsigned int)expectedFacts + 1, false);
			for (int a = 1; a <= n; a++) {
				for (int b = a + 1; b <= n; b++) {
					for (int w = 1; w <= W; w++) {
						for (int p = 1; p <= P; p++) {
							for (auto slot : {HOME, AWAY}) {
								Fact f(a, b, w, p, slot);
								auto id = indexer.getVariable(f);
								if (id < 1 or id > expectedFacts) {
									std::cout << "n=" << n << ": id " << id << " out of range for " << f.toString() << std::endl;
									return false;
								}
								if (used[id]) {
									std::cout << "n=" << n << ": id " << id << " assigned twice" << std::endl;
									return false;
								}
								used[id] = true;
								if (indexer.getFact(id) != f) {
									std::cout << "n=" << n << ": id " << id << " does not map back to " << f.toString() << std::endl;
									return false;
								}
							}
						}
					}
				}
			}
			// dense: every id was hit once and the loop above enumerated exactly expectedFacts facts
			for (int id = 1; id <= expectedFacts; id++) {
				if (!used[id]) {
					std::cout << "n=" << n << ": gap at id " << id << std::endl;
					return false;
				}
				if (indexer.getVariable(indexer.getFact(id)) != id) {
					std::cout << "n=" << n << ": id " << id << " does not round trip" << std::endl;
					return false;
				}
			}
			if (indexer.isPrimary(0) or indexer.isPrimary(expectedFacts + 1) or !indexer.isPrimary(expectedFacts)) {
				std::cout << "n=" << n << ": isPrimary is wrong at the range borders" << std::endl;
				return false;
			}
			// family accessors
			if ((int)indexer.getTeamWeekVariables(1, 1).size() != (n - 1) * P * 2 or
				(int)indexer.getPairVariables(2, 1).size() != W * P * 2 or
				(int)indexer.getSlotVariables(1, 1).size() != n * (n - 1) or
				(int)indexer.getTeamPeriodVariables(1, 1).size() != W * (n - 1) * 2) {
				std::cout << "n=" << n << ": wrong number of variables in a constraint family" << std::endl;
				return false;
			}
		}

		// same numbering for a second indexer
		VariableIndexer i1(8), i2(8);
		for (int id = 1; id <= i1.getNumFacts(); id++) {
			if (i1.getFact(id) != i2.getFact(id)) {
				std::cout << "numbering is not deterministic at id " << id << std::endl;
				return false;
			}
		}

		// contract violations
		VariableIndexer indexer(6);
		std::vector<Fact> invalidFacts = {
			Fact(2, 2, 1, 1, HOME), Fact(3, 2, 1, 1, HOME), Fact(0, 2, 1, 1, HOME), Fact(1, 7, 1, 1, HOME),
			Fact(1, 2, 0, 1, HOME), Fact(1, 2, 6, 1, HOME), Fact(1, 2, 1, 0, HOME), Fact(1, 2, 1, 4, AWAY)
		};
		for (auto &f : invalidFacts) {
			try {
				indexer.getVariable(f);
				std::cout << "no error for invalid fact (" << f.teamA << "," << f.teamB << "," << f.week << "," << f.period << ")" << std::endl;
				return false;
			}
			catch (EncodingError &e) {
				std::cout << "expected error: " << e.msg << std::endl;
			}
		}
		for (auto id : {0, -1, indexer.getNumFacts() + 1}) {
			try {
				indexer.getFact(id);
				std::cout << "no error for invalid id " << id << std::endl;
				return false;
			}
			catch (EncodingError &e) {
				std::cout << "expected error: " << e.msg << std::endl;
			}
		}
		// team counts whose facts don't fit into the variable range are rejected before anything is allocated
		for (auto n : {-2, 0, 2, 3, 5, 9, 258, 400, 100000, 2147483646}) {
			try {
				VariableIndexer invalid(n);
				std::cout << "no error for " << n << " teams" << std::endl;
				return false;
			}
			catch (InvalidInputError &e) {
				std::cout << "expected error: " << e.msg << std::endl;
			}
		}
		VariableIndexer largest(256);
		if (largest.getNumFacts() != 2130739200) {
			std::cout << "256 teams: expected 2130739200 facts but got " << largest.getNumFacts() << std::endl;
			return false;
		}
		std::cout << "Tests::variableIndexerTest: passed" << std::endl;
		return true;
	}

	bool Tests::cardinalityEncoderTest() {
		std::vector<int> bounds = {0, 1, 2, 3};
		for (int m = 0; m <= 8; m++) {
			for (auto k : bounds) {
				// k=2 is the bound used by the scheduler: check all m, the others only up to 6 literals
				if (k != 2 and m > 6) continue;
				for (int negate = 0; negate <= 1; negate++) {
					std::vector<int> literals;
					for (int i = 1; i <= m; i++) {
						literals.emplace_back((negate and i % 2 == 0) ? -i : i);
					}
					LiteralCounter counter(m);
					auto enc = CardinalityEncoder::atMost(literals, k, counter);
					auto numAux = (int)enc.auxiliaryVariables.size();
					auto expectedAux = (k >= m or k == 0) ? 0 : (m - 1) * k;
					if (numAux != expectedAux or counter.getMaxVariable() != m + numAux) {
						std::cout << "m=" << m << " k=" << k << ": expected " << expectedAux << " counter variables but got "
							<< numAux << std::endl;
						return false;
					}
					for (int i = 0; i < numAux; i++) {
						if (enc.auxiliaryVariables[i] != m + 1 + i) {
							std::cout << "m=" << m << " k=" << k << ": counter variables are not fresh" << std::endl;
							return false;
						}
					}
					for (unsigned int mask = 0; mask < (1u << m); mask++) {
						int numTrue = 0;
						for (int i = 0; i < m; i++) {
							bool value = (mask >> i) & 1u;
							if ((literals[i] > 0) == value) numTrue++;
						}
						bool expected = numTrue <= k;
						bool found = false;
						for (unsigned int auxMask = 0; auxMask < (1u << numAux) and !found; auxMask++) {
							bool allSat = true;
							for (auto &c : enc.clauses) {
								bool sat = false;
								for (auto &l : c) {
									auto v = l > 0 ? l : -l;
									bool value = v <= m ? ((mask >> (v - 1)) & 1u) : ((auxMask >> (v - m - 1)) & 1u);
									if ((l > 0) == value) {
										sat = true;
										break;
									}
								}
								if (!sat) {
									allSat = false;
									break;
								}
							}
							found = allSat;
						}
						if (found != expected) {
							std::cout << "m=" << m << " k=" << k << " assignment " << mask << " with " << numTrue
								<< " true literals: encoding says " << (found ? "SAT" : "UNSAT") << std::endl;
							return false;
						}
					}
				}
			}
		}
		try {
			LiteralCounter counter(3);
			CardinalityEncoder::atMost({1, 2, 3}, -1, counter);
			std::cout << "no error for negative bound" << std::endl;
			return false;
		}
		catch (EncodingError &e) {
			std::cout << "expected error: " << e.msg << std::endl;
		}
		std::cout << "Tests::cardinalityEncoderTest: passed" << std::endl;
		return true;
	}

	bool Tests::constraintBuilderTest() {
		{
			VariableIndexer indexer(4);
			ConstraintBuilder builder(indexer);
			builder.setQuiet(false);
			auto formula = builder.build();
			struct { const char *name; int got; int expected; } counts[] = {
				{"team/week", builder.getTeamWeekClauseCounter(), 804},
				{"pair", builder.getPairClauseCounter(), 402},
				{"slot", builder.getSlotClauseCounter(), 396},
				{"period limit", builder.getPeriodLimitClauseCounter(), 664},
				{"week", builder.getWeekClauseCounter(), 3},
				{"counter literals", builder.getAuxiliaryLiteralCounter(), 272},
				{"variables", formula.numVariables, 344},
				{"clauses", (int)formula.clauses.size(), 2269}
			};
			for (auto &c : counts) {
				if (c.got != c.expected) {
					std::cout << "4 teams: expected " << c.expected << " " << c.name << " but got " << c.got << std::endl;
					return false;
				}
			}
		}

		VariableIndexer indexer(6);
		ConstraintBuilder builder(indexer);
		auto formula = builder.build();
		if (formula.numVariables != indexer.getNumFacts() + builder.getAuxiliaryLiteralCounter()) {
			std::cout << "6 teams: variable count does not match facts + counter literals" << std::endl;
			return false;
		}
		if (!satisfiedWithDerivedCounters(formula, indexer, referenceFacts())) {
			std::cout << "6 teams: valid reference schedule violates the formula" << std::endl;
			return false;
		}
		if (satisfiedWithDerivedCounters(formula, indexer, periodViolatingFacts())) {
			std::cout << "6 teams: schedule with 3 matches of one team in one period satisfies the formula" << std::endl;
			return false;
		}
		auto incomplete = referenceFacts();
		incomplete.pop_back();
		if (satisfiedWithDerivedCounters(formula, indexer, incomplete)) {
			std::cout << "6 teams: schedule with a missing match satisfies the formula" << std::endl;
			return false;
		}
		auto doubled = referenceFacts();
		doubled.emplace_back(makeFact(1, 6, 5, 1));
		if (satisfiedWithDerivedCounters(formula, indexer, doubled)) {
			std::cout << "6 teams: schedule with a rematch satisfies the formula" << std::endl;
			return false;
		}

		// the counter must start behind the facts
		try {
			LiteralCounter counter(0);
			builder.periodLimit(counter);
			std::cout << "no error for a counter that overlaps the fact variables" << std::endl;
			return false;
		}
		catch (EncodingError &e) {
			std::cout << "expected error: " << e.msg << std::endl;
		}
		std::cout << "Tests::constraintBuilderTest: passed" << std::endl;
		return true;
	}

	bool Tests::dimacsTest() {
		CnfFormula formula(3, {{1, -2}, {2, 3}, {-1}});
		std::stringstream s;
		DimacsWriter::write(formula, s);
		std::string expected = "p cnf 3 3\n1 -2 0\n2 3 0\n-1 0\n";
		if (s.str() != expected) {
			std::cout << "Expected DIMACS output" << std::endl << expected << "but got" << std::endl << s.str() << std::endl;
			return false;
		}

		TemporaryFile file(".cnf");
		DimacsWriter(file.getPath(), formula).write();
		if (readFile(file.getPath()) != expected) {
			std::cout << "DIMACS file differs from stream output" << std::endl;
			return false;
		}
		auto back = DimacsReader::read(file.getPath());
		if (back.numVariables != 3 or back.clauses != formula.clauses) {
			std::cout << "reading the DIMACS file back gives a different formula" << std::endl;
			return false;
		}
		if (DimacsReader::readNumVariables(file.getPath()) != 3) {
			std::cout << "wrong variable count in problem line" << std::endl;
			return false;
		}

		// whole tournament formula
		VariableIndexer indexer(4);
		ConstraintBuilder builder(indexer);
		auto tournament = builder.build();
		std::stringstream t;
		DimacsWriter::write(tournament, t);
		auto tournamentBack = DimacsReader::read(t);
		if (tournamentBack.numVariables != tournament.numVariables or tournamentBack.clauses != tournament.clauses) {
			std::cout << "tournament formula changed after writing and reading" << std::endl;
			return false;
		}

		std::vector<std::string> broken = {
			"1 2 0\n",                       // no problem line
			"p cnf 2 1\n1 2\n",              // unterminated clause
			"p cnf 2 1\n1 3 0\n",            // literal out of range
			"p cnf 2 2\n1 2 0\n",            // clause count mismatch
			"p cnf 2 1\n1 x 0\n",            // garbage
			"p dnf 2 1\n1 2 0\n"             // wrong format
		};
		for (auto &b : broken) {
			try {
				std::stringstream bs(b);
				DimacsReader::read(bs);
				std::cout << "no error for broken DIMACS input '" << b << "'" << std::endl;
				return false;
			}
			catch (ParseError &e) {
				std::cout << "expected error: " << e.msg << std::endl;
			}
		}
		std::cout << "Tests::dimacsTest: passed" << std::endl;
		return true;
	}

	bool Tests::solverOutputReaderTest() {
		auto sat = parseAnswer("c glucose\nc some statistics\ns SATISFIABLE\nv 1 -2 3\nv -4 5 0\n", 5);
		std::vector<int> expected = {1, -2, 3, -4, 5};
		if (!sat.isSatisfiable() or sat.getAssignment() != expected) {
			std::cout << "competition format: wrong model" << std::endl;
			return false;
		}
		auto unsat = parseAnswer("c comment\ns UNSATISFIABLE\n", 5);
		if (unsat.isSatisfiable()) {
			std::cout << "competition format: expected UNSAT" << std::endl;
			return false;
		}
		auto minisat = parseAnswer("SAT\n-1 2 -3 0\n", 3);
		std::vector<int> expectedMinisat = {-1, 2, -3};
		if (!minisat.isSatisfiable() or minisat.getAssignment() != expectedMinisat) {
			std::cout << "MiniSat format: wrong model" << std::endl;
			return false;
		}
		if (parseAnswer("UNSAT\n", 3).isSatisfiable()) {
			std::cout << "MiniSat format: expected UNSAT" << std::endl;
			return false;
		}
		// separator lines of the solver's progress output are no status
		std::vector<std::string> unsatWithChatter = {
			"c x\n===\ns UNSATISFIABLE\n",
			"===============================================================================\nUNSAT\n",
			"Solving\n|\nINDETERMINATE_LATER\ns UNSATISFIABLE\n"
		};
		for (auto &a : unsatWithChatter) {
			if (parseAnswer(a, 5).isSatisfiable()) {
				std::cout << "expected UNSAT for answer with solver chatter '" << a << "'" << std::endl;
				return false;
			}
		}
		auto satWithChatter = parseAnswer("=====\nSAT\n1 -2 0\n", 2);
		if (!satWithChatter.isSatisfiable() or satWithChatter.getAssignment() != std::vector<int>({1, -2})) {
			std::cout << "MiniSat format with separator line: wrong model" << std::endl;
			return false;
		}
		// partial model: missing variables stay unassigned, windows line endings
		auto partial = parseAnswer("s SATISFIABLE\r\nv 2 0\r\n", 4);
		if (partial.getAssignment() != std::vector<int>({2})) {
			std::cout << "partial model: wrong assignment" << std::endl;
			return false;
		}

		std::vector<std::string> malformed = {
			"",                                        // nothing
			"c only comments\n",                       // missing status
			"v 1 2 0\n",                               // values without status
			"s SATISFIABLE\nv 1 -2 3\n",               // truncated
			"s SATISFIABLE\n",                         // no model
			"s SATISFIABLE\nv 1 two 0\n",              // garbage
			"s SATISFIABLE\nv 1 -1 0\n",               // contradiction
			"s SATISFIABLE\nv 1 9 0\n",                // out of range
			"s SATISFIABLE\nv 1 0 2\n",                // values after terminator
			"s UNSATISFIABLE\nv 1 0\n",                // model for unsat
			"s SATISFIABLE\ns UNSATISFIABLE\n",        // two status lines
			"s MAYBE\n"                                // unknown status
		};
		for (auto &m : malformed) {
			try {
				parseAnswer(m, 5);
				std::cout << "no error for malformed answer '" << m << "'" << std::endl;
				return false;
			}
			catch (ParseError &e) {
				std::cout << "expected error: " << e.msg << std::endl;
			}
		}
		try {
			parseAnswer("s UNKNOWN\n", 5);
			std::cout << "no error for UNKNOWN" << std::endl;
			return false;
		}
		catch (SolverInvocationError &e) {
			std::cout << "expected error: " << e.msg << std::endl;
		}
		std::cout << "Tests::solverOutputReaderTest: passed" << std::endl;
		return true;
	}

	bool Tests::resultDecoderTest() {
		VariableIndexer indexer(6);
		ResultDecoder decoder(indexer);

		// counter variables are ignored
		auto model = modelForFacts(indexer, referenceFacts());
		model.emplace_back(indexer.getNumFacts() + 1);
		model.emplace_back(indexer.getNumFacts() + 7);
		auto schedule = decoder.decode(SolverVerdict::satisfiable(model));
		for (int w = 1; w <= 5; w++) {
			for (int p = 1; p <= 3; p++) {
				auto &m = schedule.getMatch(w, p);
				if (m.home != referenceSchedule[w - 1][p - 1][0] or m.away != referenceSchedule[w - 1][p - 1][1]) {
					std::cout << "week " << w << " period " << p << ": expected " << referenceSchedule[w - 1][p - 1][0]
						<< " v " << referenceSchedule[w - 1][p - 1][1] << " but got " << m.home << " v " << m.away << std::endl;
					return false;
				}
			}
		}
		if (schedule.getFacts().size() != 15) {
			std::cout << "expected 15 matches but got " << schedule.getFacts().size() << std::endl;
			return false;
		}

		auto incomplete = referenceFacts();
		incomplete.erase(incomplete.begin() + 4);
		auto doubled = referenceFacts();
		doubled.emplace_back(makeFact(1, 2, 1, 1));
		std::vector<std::vector<Fact>> invalid = {periodViolatingFacts(), incomplete, doubled};
		for (auto &facts : invalid) {
			try {
				decoder.decode(SolverVerdict::satisfiable(modelForFacts(indexer, facts)));
				std::cout << "no error for an invalid model" << std::endl;
				return false;
			}
			catch (InvariantViolation &e) {
				std::cout << "expected error: " << e.msg << std::endl;
			}
		}
		try {
			decoder.decode(SolverVerdict::unsatisfiable());
			std::cout << "no error when decoding an unsatisfiable verdict" << std::endl;
			return false;
		}
		catch (Exception &e) {
			std::cout << "expected error: " << e.msg << std::endl;
		}
		std::cout << "Tests::resultDecoderTest: passed" << std::endl;
		return true;
	}

	bool Tests::invalidInputTest() {
		for (auto n : {-4, 0, 2, 3, 5, 7, 11, 100000}) {
			ScriptedSolver solver(ScriptedSolver::UNSAT);
			TournamentScheduler s(n, solver);
			try {
				s.schedule();
				std::cout << "no error for " << n << " teams" << std::endl;
				return false;
			}
			catch (InvalidInputError &e) {
				std::cout << "expected error: " << e.msg << std::endl;
			}
			if (solver.calls != 0) {
				std::cout << "solver was called for " << n << " teams" << std::endl;
				return false;
			}
			if (s.getState() != TournamentScheduler::UNBUILT) {
				std::cout << "unexpected state " << TournamentScheduler::stateToString(s.getState()) << std::endl;
				return false;
			}
		}
		std::cout << "Tests::invalidInputTest: passed" << std::endl;
		return true;
	}

	bool Tests::tournamentSchedulerTest() {
		{
			ScriptedSolver solver(ScriptedSolver::REFERENCE_MODEL);
			TournamentScheduler s(6, solver);
			s.setQuiet(false);
			s.schedule();
			if (s.getState() != TournamentScheduler::SOLVED or !s.getScheduleFound()) {
				std::cout << "expected SOLVED but got " << TournamentScheduler::stateToString(s.getState()) << std::endl;
				return false;
			}
			if (solver.calls != 1 or solver.numVariables != s.getNumVariables() or solver.numClauses != s.getNumClauses()) {
				std::cout << "solver did not receive the complete formula" << std::endl;
				return false;
			}
			if (fileExists(solver.lastPath)) {
				std::cout << "temporary formula file '" << solver.lastPath << "' was not removed" << std::endl;
				return false;
			}
			Utility::printSchedule(s.getSchedule(), std::cout);
			if (s.getSchedule().getMatch(3, 3).home != 6 or s.getSchedule().getMatch(3, 3).away != 3) {
				std::cout << "wrong match in week 3 period 3" << std::endl;
				return false;
			}
			try {
				s.schedule();
				std::cout << "no error for a second schedule() call" << std::endl;
				return false;
			}
			catch (Exception &e) {
				std::cout << "expected error: " << e.msg << std::endl;
			}
		}
		{
			ScriptedSolver solver(ScriptedSolver::UNSAT);
			TournamentScheduler s(4, solver);
			TemporaryFile cnf(".cnf");
			s.setCNFPath(cnf.getPath());
			s.schedule();
			if (s.getState() != TournamentScheduler::UNSATISFIABLE or s.getFailureKind() != TournamentScheduler::NO_FAILURE) {
				std::cout << "expected UNSATISFIABLE but got " << TournamentScheduler::stateToString(s.getState()) << std::endl;
				return false;
			}
			if (DimacsReader::read(cnf.getPath()).numVariables != s.getNumVariables()) {
				std::cout << "kept formula differs from the solved one" << std::endl;
				return false;
			}
			try {
				s.getSchedule();
				std::cout << "got a schedule for an unsatisfiable problem" << std::endl;
				return false;
			}
			catch (Exception &e) {
				std::cout << "expected error: " << e.msg << std::endl;
			}
		}
		struct {
			ScriptedSolver::Mode mode;
			TournamentScheduler::FailureKind expected;
		} failures[] = {
			{ScriptedSolver::PERIOD_VIOLATING_MODEL, TournamentScheduler::INVARIANT_VIOLATION},
			{ScriptedSolver::PARSE_FAILURE, TournamentScheduler::PARSE},
			{ScriptedSolver::TIMEOUT, TournamentScheduler::SOLVER_TIMEOUT},
			{ScriptedSolver::INVOCATION_FAILURE, TournamentScheduler::SOLVER_INVOCATION},
			{ScriptedSolver::MISSING_FILE, TournamentScheduler::SOLVER_INVOCATION}
		};
		for (auto &f : failures) {
			ScriptedSolver solver(f.mode);
			TournamentScheduler s(6, solver);
			s.schedule();
			if (s.getState() != TournamentScheduler::FAILED or s.getFailureKind() != f.expected) {
				std::cout << "expected failure '" << TournamentScheduler::failureKindToString(f.expected) << "' but got state "
					<< TournamentScheduler::stateToString(s.getState()) << " ("
					<< TournamentScheduler::failureKindToString(s.getFailureKind()) << ")" << std::endl;
				return false;
			}
			if (solver.calls != 1) {
				std::cout << "failed solver call was repeated" << std::endl;
				return false;
			}
			if (s.getSolvingTime() != 0.0) {
				std::cout << "solving time of the failed call was not recorded" << std::endl;
				return false;
			}
			std::cout << "expected failure: " << s.getFailureMessage() << std::endl;
		}
		std::cout << "Tests::tournamentSchedulerTest: passed" << std::endl;
		return true;
	}

	bool Tests::externalSolverTest() {
		// the formula path is appended to the command line and shows up as $0 of the script
		std::stringstream satScript;
		VariableIndexer indexer(6);
		satScript << "test -f \"$0\" || exit 3; echo 'c scripted solver'; echo 's SATISFIABLE'; echo 'v";
		auto facts = referenceFacts();
		for (size_t i = 0; i < facts.size(); i++) {
			satScript << " " << indexer.getVariable(facts[i]);
			if (i == 7) satScript << "'; echo 'v";
		}
		satScript << " 0'; exit 10";

		struct {
			std::string name;
			std::string executable;
			std::string script;
			int teams;
			TournamentScheduler::State expectedState;
			TournamentScheduler::FailureKind expectedFailure;
		} cases[] = {
			{"sat answer", "/bin/sh", satScript.str(), 6, TournamentScheduler::SOLVED, TournamentScheduler::NO_FAILURE},
			{"unsat answer", "/bin/sh", "test -f \"$0\" || exit 3; echo 's UNSATISFIABLE'; exit 20", 4,
				TournamentScheduler::UNSATISFIABLE, TournamentScheduler::NO_FAILURE},
			{"missing executable", "/nonexistent/tournasat-solver", "", 4, TournamentScheduler::FAILED,
				TournamentScheduler::SOLVER_INVOCATION},
			{"unknown executable", "tournasat-no-such-solver", "", 4, TournamentScheduler::FAILED,
				TournamentScheduler::SOLVER_INVOCATION},
			{"unsat answer with progress output", "/bin/sh", "echo 'c progress'; echo '==='; echo 's UNSATISFIABLE'; exit 20", 4,
				TournamentScheduler::UNSATISFIABLE, TournamentScheduler::NO_FAILURE},
			{"bad exit code", "/bin/sh", "echo 's UNSATISFIABLE'; exit 3", 4, TournamentScheduler::FAILED,
				TournamentScheduler::SOLVER_INVOCATION},
			{"truncated model", "/bin/sh", "echo 's SATISFIABLE'; echo 'v 1 -2 3'; exit 10", 4,
				TournamentScheduler::FAILED, TournamentScheduler::PARSE},
			{"missing status", "/bin/sh", "echo 'v 1 -2 3 0'; exit 0", 4, TournamentScheduler::FAILED,
				TournamentScheduler::PARSE},
			{"exit code contradicts status", "/bin/sh", "echo 's UNSATISFIABLE'; exit 10", 4,
				TournamentScheduler::FAILED, TournamentScheduler::PARSE}
		};
		for (auto &c : cases) {
			std::vector<std::string> args;
			if (!c.script.empty()) args = {"-c", c.script};
			ExternalSATSolver solver(c.executable, args);
			solver.setSolverTimeout(30);
			TournamentScheduler s(c.teams, solver);
			s.schedule();
			if (s.getState() != c.expectedState or s.getFailureKind() != c.expectedFailure) {
				std::cout << c.name << ": expected state " << TournamentScheduler::stateToString(c.expectedState) << " ("
					<< TournamentScheduler::failureKindToString(c.expectedFailure) << ") but got "
					<< TournamentScheduler::stateToString(s.getState()) << " ("
					<< TournamentScheduler::failureKindToString(s.getFailureKind()) << ") " << s.getFailureMessage()
					<< std::endl;
				return false;
			}
			if (s.getState() == TournamentScheduler::SOLVED and !verifyTournamentSchedule(s.getSchedule())) {
				std::cout << c.name << ": invalid schedule" << std::endl;
				return false;
			}
			// the solver ran, so the time is known even if its answer was rejected
			if (c.expectedFailure == TournamentScheduler::PARSE and s.getSolvingTime() < 0.0) {
				std::cout << c.name << ": solving time missing after a parse error" << std::endl;
				return false;
			}
			std::cout << c.name << ": ok " << s.getFailureMessage() << std::endl;
		}

		// timeout: the solver is killed and not restarted
		ExternalSATSolver sleeper("/bin/sh", {"-c", "sleep 10; echo 's UNSATISFIABLE'; exit 20"});
		sleeper.setSolverTimeout(0.5);
		TournamentScheduler s(4, sleeper);
		auto start = std::chrono::steady_clock::now();
		s.schedule();
		auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
		if (s.getState() != TournamentScheduler::FAILED or s.getFailureKind() != TournamentScheduler::SOLVER_TIMEOUT) {
			std::cout << "timeout: expected a timeout failure but got " << TournamentScheduler::stateToString(s.getState())
				<< " " << s.getFailureMessage() << std::endl;
			return false;
		}
		if (elapsed > 5000) {
			std::cout << "timeout: solver was not killed in time (" << elapsed << " ms)" << std::endl;
			return false;
		}

		// processes started by a wrapper script are killed together with it
		std::string marker;
		{
			TemporaryFile markerFile(".alive");
			marker = markerFile.getPath();
		}
		ExternalSATSolver wrapper("/bin/sh", {"-c", "(sleep 1; touch '" + marker + "') & wait"});
		wrapper.setSolverTimeout(0.3);
		TournamentScheduler wrapped(4, wrapper);
		wrapped.schedule();
		if (wrapped.getFailureKind() != TournamentScheduler::SOLVER_TIMEOUT) {
			std::cout << "wrapper timeout: expected a timeout failure but got " <<
				TournamentScheduler::stateToString(wrapped.getState()) << " " << wrapped.getFailureMessage() << std::endl;
			return false;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(2000));
		if (fileExists(marker)) {
			std::remove(marker.c_str());
			std::cout << "wrapper timeout: child of the solver process survived the timeout" << std::endl;
			return false;
		}
		std::cout << "Tests::externalSolverTest: passed" << std::endl;
		return true;
	}

	bool Tests::scheduleWriterTest() {
		Schedule schedule(6, referenceFacts());
		TemporaryFile file(".csv");
		ScheduleWriter writer(file.getPath(), schedule);
		writer.setFormulaSize(100, 200);
		writer.write();
		auto content = readFile(file.getPath());
		std::string expectedStart = "# teams 6\n# weeks 5\n# periods 3\n# variables 100\n# clauses 200\n# week;period;home;away\n1;1;6;1\n1;2;2;5\n";
		if (content.compare(0, expectedStart.size(), expectedStart) != 0) {
			std::cout << "unexpected csv content:" << std::endl << content << std::endl;
			return false;
		}
		std::stringstream lines(content);
		std::string line;
		int matches = 0;
		while (std::getline(lines, line)) {
			if (!line.empty() and line[0] != '#') matches++;
		}
		if (matches != 15) {
			std::cout << "expected 15 match lines but got " << matches << std::endl;
			return false;
		}
		try {
			ScheduleWriter("", schedule).write();
			std::cout << "no error for an empty path" << std::endl;
			return false;
		}
		catch (Exception &e) {
			std::cout << "expected error: " << e.msg << std::endl;
		}
		std::cout << "Tests::scheduleWriterTest: passed" << std::endl;
		return true;
	}

	bool Tests::cadicalTest() {
#ifdef USE_CADICAL
		std::cout << "CaDiCaL-Test started..." << std::endl;
		CaDiCaLSATSolver solver;
		solver.setQuiet(false);
		if (!solveFourAndSixTeams(solver)) return false;
		std::cout << "Tests::cadicalTest: passed" << std::endl;
		return true;
#else
		std::cout << "CaDiCaL not active! Test function disabled!" << std::endl;
		return true;
#endif
	}

	bool Tests::z3Test() {
#ifdef USE_Z3
		std::cout << "Z3-Test started..." << std::endl;
		Z3SATSolver solver;
		if (!solveFourAndSixTeams(solver)) return false;

		// budgets outside of z3's millisecond range
		struct { double seconds; unsigned expected; } budgets[] = {
			{300.0, 300000u}, {1e-6, 1u}, {0.0, 1u}, {1e12, std::numeric_limits<unsigned>::max()},
			{5e6, std::numeric_limits<unsigned>::max()}
		};
		for (auto &b : budgets) {
			if (Z3SATSolver::timeoutInMilliseconds(b.seconds) != b.expected) {
				std::cout << "budget of " << b.seconds << " sec: expected " << b.expected << " ms but got "
					<< Z3SATSolver::timeoutInMilliseconds(b.seconds) << std::endl;
				return false;
			}
		}
		solver.setSolverTimeout(1e12);
		TournamentScheduler four(4, solver);
		four.schedule();
		if (four.getState() != TournamentScheduler::UNSATISFIABLE) {
			std::cout << "huge budget: expected UNSATISFIABLE but got " << TournamentScheduler::stateToString(four.getState())
				<< " " << four.getFailureMessage() << std::endl;
			return false;
		}
		std::cout << "Tests::z3Test: passed" << std::endl;
		return true;
#else
		std::cout << "Z3 not active! Test function disabled!" << std::endl;
		return true;
#endif
	}
}
