#pragma once

// codebox_cli ask <question...|->
int cmd_ask(int argc, char** argv);
