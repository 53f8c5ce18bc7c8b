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

#pragma once

#include <exception>
#include <ostream>
#include <string>

namespace TournaSAT
{

/*!
 * \brief The Exception class implements exceptions thrown by TournaSAT
 */
class Exception : public std::exception
{
public:
  std::string msg;

  Exception(std::string s) :msg(s)
  {
  }

  virtual const char* what() const noexcept override;
};

std::ostream& operator<<( std::ostream& oss, TournaSAT::Exception &e);

/*!
 * \brief thrown for team counts that cannot be scheduled (odd or smaller than four)
 */
class InvalidInputError : public Exception
{
public:
  InvalidInputError(std::string s) : Exception(s) {}
};

/*!
 * \brief inconsistent variable numbering or clause construction
 */
class EncodingError : public Exception
{
public:
  EncodingError(std::string s) : Exception(s) {}
};

/*!
 * \brief the SAT solver could not be started or terminated abnormally
 */
class SolverInvocationError : public Exception
{
public:
  SolverInvocationError(std::string s) : Exception(s) {}
};

/*!
 * \brief the SAT solver exceeded its time budget
 */
class SolverTimeoutError : public Exception
{
public:
  SolverTimeoutError(std::string s) : Exception(s) {}
};

/*!
 * \brief solver input or output does not match the expected format
 */
class ParseError : public Exception
{
public:
  ParseError(std::string s) : Exception(s) {}
};

/*!
 * \brief a decoded schedule breaks one of the tournament invariants
 */
class InvariantViolation : public Exception
{
public:
  InvariantViolation(std::string s) : Exception(s) {}
};

}
