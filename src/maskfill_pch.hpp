#pragma once
#ifndef mf_maskfill_pch_h
#define mf_maskfill_pch_h

#include<algorithm>
#include<array>
#include<cmath>
#include<cstdint>
#include<filesystem>
#include<limits>
#include<memory>
#include<mutex>
#include<optional>
#include<shared_mutex>
#include<sstream>
#include<stdexcept>
#include<string>
#include<thread>
#include<type_traits>
#include<unordered_map>
#include<unordered_set>
#include<vector>

#include<gdal_priv.h>
#include<ogrsf_frmts.h>
#include<ogr_spatialref.h>
#include<cpl_conv.h>
#include<cpl_error.h>
#include<cpl_multiproc.h>
#include<cpl_string.h>

#include<proj.h>

#include<xtl/xoptional.hpp>
#include<xtl/xoptional_sequence.hpp>

#endif
