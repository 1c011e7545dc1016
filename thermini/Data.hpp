#ifndef THERMINI_DATA_HPP_
#define THERMINI_DATA_HPP_

#include "Data/Composition.hpp"
#include "Data/ControlData.hpp"
#include "Data/DataEnums.hpp"
#include "Data/DataReader.hpp"
#include "Data/EquipmentData.hpp"
#include "Data/FluidData.hpp"
#include "Data/FluidState.hpp"
#include "Data/PerformanceData.hpp"
#include "Data/PidData.hpp"
#include "Data/RoomData.hpp"

#endif // THERMINI_DATA_HPP_
