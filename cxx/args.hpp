#pragma once

#include "mm/types.hpp"

#include <args.hxx>

extern args::Group    global_group;
extern args::HelpFlag help;

void SetLogging(std::string const &name);
void ParseCommand(args::Subparser &parser);
void ParseCommand(args::Subparser &parser, args::Positional<std::string> &iname);
void ParseCommand(args::Subparser &parser, args::Positional<std::string> &iname, args::Positional<std::string> &oname);
