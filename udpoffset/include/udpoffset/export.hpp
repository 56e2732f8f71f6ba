// Copyright (c) 2025
#pragma once

#if defined(_WIN32)
#if defined(UDP_OFFSET_BUILDING_DLL)
#define UDP_OFFSET_API __declspec(dllexport)
#elif defined(UDP_OFFSET_SHARED)
#define UDP_OFFSET_API __declspec(dllimport)
#else
#define UDP_OFFSET_API
#endif
#else
#define UDP_OFFSET_API
#endif
