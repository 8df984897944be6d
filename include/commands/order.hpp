#pragma once

int cmd_order(int argc, char** argv);
