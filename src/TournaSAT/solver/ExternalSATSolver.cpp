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

#include "ExternalSATSolver.h"
#include <TournaSAT/utility/Exception.h>
#include <TournaSAT/utility/TemporaryFile.h>
#include <TournaSAT/utility/reader/DimacsReader.h>
#include <TournaSAT/utility/reader/SolverOutputReader.h>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

#define SAT_EXIT_CODE 10
#define UNSAT_EXIT_CODE 20
#define EXEC_FAILED_EXIT_CODE 127

namespace TournaSAT {

	ExternalSATSolver::ExternalSATSolver(std::string executable, std::vector<std::string> arguments)
		: SATSolverBase(), executable(std::move(executable)), arguments(std::move(arguments)) {
	}

	static bool isExecutableFile(const std::string &path) {
		struct stat st;
		if (stat(path.c_str(), &st) != 0) return false;
		return S_ISREG(st.st_mode) and access(path.c_str(), X_OK) == 0;
	}

	std::string ExternalSATSolver::locateExecutable() const {
		if (this->executable.empty()) return "";
		if (this->executable.find('/') != std::string::npos) {
			return isExecutableFile(this->executable) ? this->executable : "";
		}
		auto env = std::getenv("PATH");
		std::string searchPath = env != nullptr ? env : "/usr/local/bin:/usr/bin:/bin";
		std::stringstream s(searchPath);
		std::string dir;
		while (std::getline(s, dir, ':')) {
			if (dir.empty()) dir = ".";
			auto candidate = dir + "/" + this->executable;
			if (isExecutableFile(candidate)) return candidate;
		}
		return "";
	}

	int ExternalSATSolver::startProcess(const std::string &executablePath, const std::string &cnfPath,
		const std::string &outputPath) {
		// argv must be prepared before fork
		std::vector<std::string> args;
		args.emplace_back(this->executable);
		args.insert(args.end(), this->arguments.begin(), this->arguments.end());
		args.emplace_back(cnfPath);
		std::vector<char*> argv;
		for (auto &a : args) argv.push_back(const_cast<char*>(a.c_str()));
		argv.push_back(nullptr);

		pid_t pid = -1;
		for (int attempt = 0; attempt < 2; attempt++) {
			pid = fork();
			if (pid >= 0 or errno != EAGAIN) break;
			if (!this->quiet) {
				std::cout << "ExternalSATSolver: fork failed temporarily - retrying once" << std::endl;
			}
			std::this_thread::sleep_for(std::chrono::milliseconds(100));
		}
		if (pid < 0) {
			throw SolverInvocationError("ExternalSATSolver: failed to fork: " + std::string(std::strerror(errno)));
		}
		if (pid == 0) {
			// child: own process group, so a timeout also stops processes started by wrapper scripts
			setpgid(0, 0);
			int out = open(outputPath.c_str(), O_WRONLY | O_TRUNC);
			if (out < 0 or dup2(out, STDOUT_FILENO) < 0) _exit(EXEC_FAILED_EXIT_CODE);
			close(out);
			if (this->quiet) {
				int devNull = open("/dev/null", O_WRONLY);
				if (devNull >= 0) {
					dup2(devNull, STDERR_FILENO);
					close(devNull);
				}
			}
			execv(executablePath.c_str(), argv.data());
			_exit(EXEC_FAILED_EXIT_CODE);
		}
		setpgid(pid, pid);
		return (int)pid;
	}

	int ExternalSATSolver::waitForProcess(int pid) {
		auto start = std::chrono::steady_clock::now();
		int status = 0;
		while (true) {
			auto res = waitpid((pid_t)pid, &status, WNOHANG);
			if (res == pid) return status;
			if (res < 0 and errno != EINTR) {
				throw SolverInvocationError("ExternalSATSolver: waitpid failed: " + std::string(std::strerror(errno)));
			}
			auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
				std::chrono::steady_clock::now() - start).count() / 1000.0;
			if (this->solverTimeout > 0.0 and elapsed >= this->solverTimeout) {
				kill(-(pid_t)pid, SIGKILL);
				while (waitpid((pid_t)pid, &status, 0) < 0 and errno == EINTR) {}
				this->solvingTime = elapsed;
				throw SolverTimeoutError("ExternalSATSolver: '" + this->executable + "' exceeded the time budget of " +
					std::to_string(this->solverTimeout) + " sec");
			}
			std::this_thread::sleep_for(std::chrono::milliseconds(10));
		}
	}

	SolverVerdict ExternalSATSolver::solve(const std::string &cnfPath) {
		this->solvingTime = -1.0;
		auto executablePath = this->locateExecutable();
		if (executablePath.empty()) {
			throw SolverInvocationError("ExternalSATSolver: SAT solver executable '" + this->executable + "' not found");
		}
		auto numVariables = DimacsReader::readNumVariables(cnfPath);
		TemporaryFile output(".out");

		if (!this->quiet) {
			std::cout << "ExternalSATSolver: starting '" << executablePath << "' on '" << cnfPath << "'" << std::endl;
		}
		auto start = std::chrono::steady_clock::now();
		auto pid = this->startProcess(executablePath, cnfPath, output.getPath());
		auto status = this->waitForProcess(pid);
		this->solvingTime = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now() - start).count() / 1000.0;

		if (WIFSIGNALED(status)) {
			throw SolverInvocationError("ExternalSATSolver: '" + this->executable + "' was terminated by signal " +
				std::to_string(WTERMSIG(status)));
		}
		auto exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
		if (!this->quiet) {
			std::cout << "ExternalSATSolver: solver finished with exit code " << exitCode << " after "
				<< this->solvingTime << " sec" << std::endl;
		}
		if (exitCode == EXEC_FAILED_EXIT_CODE) {
			throw SolverInvocationError("ExternalSATSolver: failed to execute '" + executablePath + "'");
		}
		if (exitCode != 0 and exitCode != SAT_EXIT_CODE and exitCode != UNSAT_EXIT_CODE) {
			throw SolverInvocationError("ExternalSATSolver: '" + this->executable + "' returned unexpected exit code " +
				std::to_string(exitCode));
		}

		SolverOutputReader reader(numVariables);
		reader.setQuiet(this->quiet);
		auto verdict = reader.read(output.getPath());
		if ((exitCode == SAT_EXIT_CODE and !verdict.isSatisfiable()) or
			(exitCode == UNSAT_EXIT_CODE and verdict.isSatisfiable())) {
			throw ParseError("ExternalSATSolver: exit code " + std::to_string(exitCode) +
				" contradicts the reported status");
		}
		return verdict;
	}
}
