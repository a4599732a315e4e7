#pragma once

// Normally injected by the build from project(VERSION ...).
#ifndef PARAFETCH_VERSION
#define PARAFETCH_VERSION "0.1.0"
#endif
