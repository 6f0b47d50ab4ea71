// ログ出力先

#ifndef _RTLSDRUSB_LOG_HPP_
#define _RTLSDRUSB_LOG_HPP_

#include <iostream>

namespace rtlsdrusb {

// plog == NULL disables logging. verbose adds register and PLL traces.
void setLog(std::ostream *plog, bool verbose = false);

std::ostream *logOut();
std::ostream *traceOut();

}

#endif
