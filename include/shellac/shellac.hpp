#ifndef SHELLAC_SHELLAC_HPP
#define SHELLAC_SHELLAC_HPP

#include "command.hpp"
#include "completion.hpp"
#include "context.hpp"
#include "param.hpp"
#include "parser.hpp"
#include "shell.hpp"
#include "types.hpp"
#include "utils.hpp"

#endif // SHELLAC_SHELLAC_HPP
