/**
 * @file    ascii_logo.hpp
 * @brief   Console banner
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

namespace wms {

inline constexpr const char* ASCII_BANNER = R"(
                                            
 __      ___ __ ___  ___  ___ __ _ _ __   
 \ \ /\ / / '_ ` _ \/ __|/ __/ _` | '_ \  
  \ V  V /| | | | | \__ \ (_| (_| | | | | 
   \_/\_/ |_| |_| |_|___/\___\__,_|_| |_| 
                                            
)";

}  // namespace wms
