#pragma once

// SIGINT/SIGTERM only raise a flag; a run polls it between steps.
void install_interrupt_handler();
bool interrupt_requested();
void reset_interrupt();
