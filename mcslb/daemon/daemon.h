#pragma once

// Load configuration, bring every component up and run until SIGINT/SIGTERM.
// Returns the process exit status.
int lb_start(int argc, char** argv);
