#pragma once

// Subcommands of frameguard_cli. argv is the full command line.
int cmd_serve(int argc, char** argv);
int cmd_exec(int argc, char** argv);
int cmd_scan(int argc, char** argv);
int cmd_check(int argc, char** argv);
