#ifndef SPRAY_DEBUG_H
#define SPRAY_DEBUG_H
#pragma once

#ifndef NDEBUG
#define DEBUG
#endif

#include <iostream>

#ifdef DEBUG
	#define ASSERT(exp) do { if(!(exp)) std::cerr << "Assertion failed: " << #exp " at(" __FILE__ ":" << __LINE__ << ")\n"; } while(false)
#else
	#define ASSERT(exp) do {} while(false)
#endif

#endif
