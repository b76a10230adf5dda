#ifndef MAXWEIGHTMATCHING_TIMER_H
#define MAXWEIGHTMATCHING_TIMER_H

#include <chrono>


#define duration(a) std::chrono::duration_cast<std::chrono::milliseconds>(a).count()
#define timeNow() std::chrono::high_resolution_clock::now()


#endif //MAXWEIGHTMATCHING_TIMER_H
