#pragma once

// codebox_cli run <script.js|-> [capabilities.json]
int cmd_run(int argc, char** argv);
