#ifndef CCIDPROTOCOL_H
#define CCIDPROTOCOL_H
#pragma once
#include <cstdint>

// Константы USB CCID rev 1.1 / USB-ICC ICCD rev 1.0.
namespace ccidgadget {
namespace ccid {

constexpr uint8_t  USB_CLASS_CCID   = 0x0B;
constexpr uint32_t HEADER_LEN       = 10;

// CCID Bulk-OUT сообщения (PC_to_RDR)
constexpr uint8_t PC_to_RDR_SetParameters    = 0x61;
constexpr uint8_t PC_to_RDR_IccPowerOn       = 0x62;
constexpr uint8_t PC_to_RDR_IccPowerOff      = 0x63;
constexpr uint8_t PC_to_RDR_GetSlotStatus    = 0x65;
constexpr uint8_t PC_to_RDR_Secure           = 0x69;
constexpr uint8_t PC_to_RDR_T0APDU           = 0x6A;
constexpr uint8_t PC_to_RDR_Escape           = 0x6B;
constexpr uint8_t PC_to_RDR_GetParameters    = 0x6C;
constexpr uint8_t PC_to_RDR_ResetParameters  = 0x6D;
constexpr uint8_t PC_to_RDR_IccClock         = 0x6E;
constexpr uint8_t PC_to_RDR_XfrBlock         = 0x6F;
constexpr uint8_t PC_to_RDR_Mechanical       = 0x71;
constexpr uint8_t PC_to_RDR_Abort            = 0x72;
constexpr uint8_t PC_to_RDR_SetDataRateAndClockFrequency = 0x73;

// CCID ответы Bulk-IN (RDR_to_PC)
constexpr uint8_t RDR_to_PC_DataBlock        = 0x80;
constexpr uint8_t RDR_to_PC_SlotStatus       = 0x81;
constexpr uint8_t RDR_to_PC_Parameters       = 0x82;
constexpr uint8_t RDR_to_PC_Escape           = 0x83;
constexpr uint8_t RDR_to_PC_DataRateAndClockFrequency = 0x84;

// Interrupt-IN
constexpr uint8_t RDR_to_PC_NotifySlotChange = 0x50;
constexpr uint8_t RDR_to_PC_HardwareError    = 0x51;

// Запрос класса на control-канале
constexpr uint8_t REQUEST_ABORT = 0x01;

// bmICCStatus, биты 0..1 bStatus
enum class IccStatus : uint8_t { Active = 0, Inactive = 1, NotPresent = 2 };

// bmCommandStatus, биты 6..7 bStatus
enum class CommandStatus : uint8_t { Ok = 0, Failed = 1, TimeExtension = 2 };

constexpr uint8_t makeStatus(IccStatus icc, CommandStatus cmd) {
    return uint8_t(uint8_t(icc) | (uint8_t(cmd) << 6));
}
constexpr IccStatus iccStatusOf(uint8_t bStatus) { return IccStatus(bStatus & 0x03); }
constexpr CommandStatus commandStatusOf(uint8_t bStatus) { return CommandStatus((bStatus >> 6) & 0x03); }

// bError. Значения меньше 0x80: смещение ошибочного поля заголовка.
constexpr uint8_t ERROR_CMD_ABORTED          = 0xFF;
constexpr uint8_t ERROR_ICC_MUTE             = 0xFE;
constexpr uint8_t ERROR_XFR_PARITY_ERROR     = 0xFD;
constexpr uint8_t ERROR_XFR_OVERRUN          = 0xFC;
constexpr uint8_t ERROR_HW_ERROR             = 0xFB;
constexpr uint8_t ERROR_BAD_ATR_TS           = 0xF8;
constexpr uint8_t ERROR_BAD_ATR_TCK          = 0xF7;
constexpr uint8_t ERROR_ICC_PROTOCOL_NOT_SUPPORTED = 0xF6;
constexpr uint8_t ERROR_ICC_CLASS_NOT_SUPPORTED    = 0xF5;
constexpr uint8_t ERROR_PROCEDURE_BYTE_CONFLICT    = 0xF4;
constexpr uint8_t ERROR_DEACTIVATED_PROTOCOL       = 0xF3;
constexpr uint8_t ERROR_BUSY_WITH_AUTO_SEQUENCE    = 0xF2;
constexpr uint8_t ERROR_CMD_SLOT_BUSY        = 0xE0;
constexpr uint8_t ERROR_CMD_NOT_SUPPORTED    = 0x00;
constexpr uint8_t ERROR_BAD_LENGTH           = 0x01;
constexpr uint8_t ERROR_SLOT_DOES_NOT_EXIST  = 0x05;
constexpr uint8_t ERROR_BAD_POWERSELECT      = 0x07;
constexpr uint8_t ERROR_BAD_PROTOCOLNUM      = 0x07;
constexpr uint8_t ERROR_BAD_WLEVEL           = 0x08;

// wLevelParameter в XfrBlock (обмен extended APDU)
constexpr uint16_t LEVEL_BEGIN_AND_END  = 0x0000;
constexpr uint16_t LEVEL_BEGIN          = 0x0001;
constexpr uint16_t LEVEL_END            = 0x0002;
constexpr uint16_t LEVEL_INTERMEDIATE   = 0x0003;
constexpr uint16_t LEVEL_CONTINUE       = 0x0010;

// bChainParameter в DataBlock
constexpr uint8_t CHAIN_BEGIN_AND_END   = 0x00;
constexpr uint8_t CHAIN_BEGIN           = 0x01;
constexpr uint8_t CHAIN_END             = 0x02;
constexpr uint8_t CHAIN_INTERMEDIATE    = 0x03;
constexpr uint8_t CHAIN_CONTINUE        = 0x10;

// bClockStatus в SlotStatus
constexpr uint8_t CLOCK_RUNNING         = 0x00;
constexpr uint8_t CLOCK_STOPPED         = 0x03;

// bPowerSelect -> бит bVoltageSupport
constexpr uint8_t POWER_SELECT_AUTO     = 0x00;
constexpr uint8_t VOLTAGE_5V            = 0x01;
constexpr uint8_t VOLTAGE_3V            = 0x02;
constexpr uint8_t VOLTAGE_1_8V          = 0x04;

constexpr uint8_t PROTOCOL_T0           = 0x00;
constexpr uint8_t PROTOCOL_T1           = 0x01;
constexpr uint32_t T1_PARAMETERS_LEN    = 7;

// Тип ответа на данную команду.
constexpr uint8_t responseTypeFor(uint8_t commandType) {
    switch (commandType) {
    case PC_to_RDR_IccPowerOn:
    case PC_to_RDR_XfrBlock:
    case PC_to_RDR_Secure:
        return RDR_to_PC_DataBlock;
    case PC_to_RDR_GetParameters:
    case PC_to_RDR_ResetParameters:
    case PC_to_RDR_SetParameters:
        return RDR_to_PC_Parameters;
    case PC_to_RDR_Escape:
        return RDR_to_PC_Escape;
    case PC_to_RDR_SetDataRateAndClockFrequency:
        return RDR_to_PC_DataRateAndClockFrequency;
    default:
        return RDR_to_PC_SlotStatus;
    }
}

} // namespace ccid
} // namespace ccidgadget
#endif // CCIDPROTOCOL_H
